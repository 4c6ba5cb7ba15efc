#include "feed_parser.hpp"
#include "dates.hpp"
#include "errors.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/tree.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace News
{
    namespace
    {
        struct XmlDocDeleter
        {
            void operator()(xmlDocPtr doc) const noexcept
            {
                if(doc) xmlFreeDoc(doc);
            }
        };

        using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

        bool is_element(xmlNodePtr node, const char* name)
        {
            return node && node->type == XML_ELEMENT_NODE &&
                   xmlStrcasecmp(node->name, BAD_CAST name) == 0;
        }

        std::string trim(const std::string& text)
        {
            size_t start = text.find_first_not_of(" \t\n\r");
            size_t end = text.find_last_not_of(" \t\n\r");
            return (start == std::string::npos) ? "" : text.substr(start, end - start + 1);
        }

        std::string node_text(xmlNodePtr node)
        {
            if (!node) return "";
            xmlChar* content = xmlNodeGetContent(node);
            if (!content) return "";
            std::string result(reinterpret_cast<char*>(content));
            xmlFree(content);
            return trim(result);
        }

        std::string attribute(xmlNodePtr node, const char* name)
        {
            xmlChar* value = xmlGetProp(node, BAD_CAST name);
            if(!value) return "";
            std::string result(reinterpret_cast<char*>(value));
            xmlFree(value);
            return trim(result);
        }

        xmlNodePtr find_descendant(xmlNodePtr node, const char* name)
        {
            for(xmlNodePtr child = node ? node->children : nullptr; child; child = child->next)
            {
                if(is_element(child, name))
                    return child;
                if(xmlNodePtr found = find_descendant(child, name))
                    return found;
            }
            return nullptr;
        }

        void collect_descendants(xmlNodePtr node, const char* name, std::vector<xmlNodePtr>& out)
        {
            for(xmlNodePtr child = node ? node->children : nullptr; child; child = child->next)
            {
                if(is_element(child, name))
                    out.push_back(child);
                collect_descendants(child, name, out);
            }
        }

        bool is_coverage_label(const std::string& text)
        {
            return text.find("Full Coverage") != std::string::npos ||
                   text.find("전체 콘텐츠 보기") != std::string::npos;
        }

        // <link>url</link> in RSS, <link rel="alternate" href="url"/> in Atom.
        std::string entry_link(xmlNodePtr entry)
        {
            std::string fallback;
            for(xmlNodePtr child = entry->children; child; child = child->next)
            {
                if(!is_element(child, "link"))
                    continue;

                std::string href = attribute(child, "href");
                if(href.empty())
                {
                    std::string text = node_text(child);
                    if(!text.empty()) return text;
                    continue;
                }

                std::string rel = attribute(child, "rel");
                if(rel.empty() || rel == "alternate")
                    return href;
                if(fallback.empty())
                    fallback = href;
            }
            return fallback;
        }

        std::optional<NewsItem> parse_entry(xmlNodePtr entry, size_t index)
        {
            NewsItem item;
            std::string guid;
            std::string date_text;
            std::string description;

            for(xmlNodePtr child = entry->children; child; child = child->next)
            {
                if(child->type != XML_ELEMENT_NODE)
                    continue;

                std::string name(reinterpret_cast<const char*>(child->name));

                if(name == "title")
                    item.title = node_text(child);
                else if(name == "guid" || name == "id")
                    guid = node_text(child);
                else if(name == "pubDate" || name == "published" || (name == "date" && date_text.empty()))
                    date_text = node_text(child);
                else if(name == "updated" && date_text.empty())
                    date_text = node_text(child);
                else if(name == "source")
                {
                    std::string source = node_text(child);
                    if(!source.empty()) item.source = source;
                }
                else if(name == "description" || name == "summary")
                    description = node_text(child);
            }

            item.link = entry_link(entry);
            item.guid = guid.empty() ? item.link : guid;

            if(item.guid.empty())
            {
                std::cerr << "[FeedParser] Warning: entry " << index << " (\"" << item.title
                          << "\") has no guid or link, skipping\n";
                return std::nullopt;
            }

            if(!date_text.empty())
            {
                item.pub_date = Dates::parse_feed_date(date_text);
                if(!item.pub_date)
                    std::cerr << "[FeedParser] Warning: unparsable date \"" << date_text << "\" for " << item.guid << '\n';
            }

            if(!description.empty())
                FeedParser::parse_description(description, item);

            return item;
        }
    }

    std::vector<NewsItem> FeedParser::parse(const RawDocument& doc)
    {
        XmlDocPtr xml(xmlReadMemory(doc.body.c_str(), static_cast<int>(doc.body.size()), doc.url.c_str(), nullptr,
                                    XML_PARSE_RECOVER | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NONET));
        if(!xml)
            throw FetchError(FetchError::Kind::Parse, "Feed body is not well-formed XML: " + doc.url);

        xmlNodePtr root = xmlDocGetRootElement(xml.get());
        if(!root)
            throw FetchError(FetchError::Kind::Parse, "Feed document is empty: " + doc.url);

        std::vector<xmlNodePtr> entries;

        // RSS 2.0: <rss><channel><item>; RSS 1.0: <rdf:RDF><item>
        if(is_element(root, "rss") || is_element(root, "RDF"))
            collect_descendants(root, "item", entries);
        // Atom: <feed><entry>
        else if(is_element(root, "feed"))
        {
            for(xmlNodePtr child = root->children; child; child = child->next)
                if(is_element(child, "entry")) entries.push_back(child);
        }
        else
        {
            throw FetchError(FetchError::Kind::Parse,
                             std::string("Unsupported feed root element <") +
                             reinterpret_cast<const char*>(root->name) + "> in " + doc.url);
        }

        std::vector<NewsItem> items;
        items.reserve(entries.size());

        for(size_t i = 0; i < entries.size(); ++i)
        {
            if(auto item = parse_entry(entries[i], i))
                items.push_back(std::move(*item));
        }

        std::cout << "[FeedParser] Parsed " << items.size() << " of " << entries.size() << " entries\n";
        return items;
    }

    void FeedParser::parse_description(std::string_view html, NewsItem& item)
    {
        XmlDocPtr doc(htmlReadMemory(html.data(), static_cast<int>(html.size()), nullptr, "UTF-8",
                                     HTML_PARSE_RECOVER | HTML_PARSE_NOERROR | HTML_PARSE_NOWARNING | HTML_PARSE_NONET));
        if(!doc)
            return;

        std::vector<xmlNodePtr> list_items;
        collect_descendants(xmlDocGetRootElement(doc.get()), "li", list_items);

        for(xmlNodePtr li : list_items)
        {
            xmlNodePtr anchor = find_descendant(li, "a");
            if(!anchor)
                continue;

            std::string text = node_text(anchor);
            std::string href = attribute(anchor, "href");

            if(is_coverage_label(text))
            {
                item.coverage_link = href;
                continue;
            }

            xmlNodePtr press = find_descendant(li, "font");
            if(text.empty() || href.empty())
                continue;

            item.related.push_back(RelatedArticle{text, href, press ? node_text(press) : ""});
        }
    }
}
