#include "reference_rewriter.h"

#include <cctype>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unordered_map>
#include <vector>

#include <pugixml.hpp>

namespace epubgs
{
  namespace
  {
    constexpr const char *kOpfNamespace = "http://www.idpf.org/2007/opf";

    // 参照文字列を写像に照らして置き換える。
    class ReferenceMatcher
    {
    public:
      ReferenceMatcher(const PathMapping &mapping, const RewriteOptions &opt)
          : mapping_(mapping), opt_(opt)
      {
        for (const auto &e : mapping.entries())
        {
          const std::string old_name = basename_of(e.first);
          const std::string new_name = basename_of(e.second);
          if (old_name == new_name)
            continue;
          // first entry wins when two keys share a filename
          by_name_.emplace(old_name, new_name);
        }
      }

      bool empty() const
      {
        return by_name_.empty();
      }

      bool remap(const std::string &ref, std::string &replaced) const
      {
        const auto suffix_pos = ref.find_first_of("?#");
        const std::string path = ref.substr(0, suffix_pos);
        const std::string suffix = suffix_pos == std::string::npos ? std::string() : ref.substr(suffix_pos);
        if (path.empty() || has_scheme(path))
          return false;

        const std::string name = basename_of(path);
        const std::string prefix = path.substr(0, path.size() - name.size());

        std::string new_name;
        if (opt_.match == MatchMode::FullPath)
        {
          const std::string *target = mapping_.find(join_relative(opt_.base_dir, path));
          if (!target)
            return false;
          new_name = basename_of(*target);
          if (new_name == name)
            return false;
        }
        else
        {
          const auto it = by_name_.find(name);
          if (it == by_name_.end())
            return false;
          new_name = it->second;
        }

        replaced = prefix + new_name + suffix;
        return true;
      }

    private:
      // "http:", "data:" などスキームを持つ参照はアーカイブ外
      // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ), at least two
      // characters so a bare "a:b.jpg" stays a relative file name.
      static bool has_scheme(const std::string &path)
      {
        const auto colon = path.find(':');
        if (colon == std::string::npos || colon < 2)
          return false;
        if (!std::isalpha(static_cast<unsigned char>(path[0])))
          return false;
        for (size_t i = 1; i < colon; ++i)
        {
          const unsigned char c = static_cast<unsigned char>(path[i]);
          if (!std::isalnum(c) && c != '+' && c != '-' && c != '.')
            return false;
        }
        return true;
      }

      const PathMapping &mapping_;
      const RewriteOptions &opt_;
      std::unordered_map<std::string, std::string> by_name_;
    };

    bool is_name_char(char c)
    {
      const unsigned char u = static_cast<unsigned char>(c);
      return std::isalnum(u) || c == ':' || c == '_' || c == '-' || c == '.';
    }

    bool is_space(char c)
    {
      return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    bool is_reference_attribute(const std::string &lower_name)
    {
      return lower_name == "src" || lower_name == "href" || lower_name == "xlink:href";
    }

    // Copies an unparsed section [i, terminator + len) verbatim.
    size_t copy_through(const std::string &content, size_t i, const char *terminator, std::string &out)
    {
      size_t end = content.find(terminator, i);
      end = (end == std::string::npos) ? content.size() : end + std::strlen(terminator);
      out.append(content, i, end - i);
      return end;
    }

    bool starts_with_ci(const std::string &s, size_t pos, const char *lit)
    {
      const size_t len = std::strlen(lit);
      if (pos + len > s.size())
        return false;
      for (size_t k = 0; k < len; ++k)
      {
        if (std::tolower(static_cast<unsigned char>(s[pos + k])) != lit[k])
          return false;
      }
      return true;
    }

    bool is_ident_char(char c)
    {
      const unsigned char u = static_cast<unsigned char>(c);
      return std::isalnum(u) || c == '-' || c == '_';
    }

    bool has_name(const pugi::xml_node &node, const std::string &name)
    {
      return node.type() == pugi::node_element && name == node.name();
    }

    // OPF 名前空間に束縛された接頭辞を返す (なければ空)。
    std::string opf_prefix(const pugi::xml_node &root)
    {
      const std::string root_name = root.name();
      const auto colon = root_name.find(':');
      if (colon != std::string::npos)
        return root_name.substr(0, colon);
      for (const pugi::xml_attribute &attr : root.attributes())
      {
        const std::string name = attr.name();
        if (name.compare(0, 6, "xmlns:") == 0 && std::strcmp(attr.value(), kOpfNamespace) == 0)
          return name.substr(6);
      }
      return std::string();
    }

    pugi::xml_node find_descendant(const pugi::xml_node &root, const std::string &name)
    {
      return root.find_node([&name](const pugi::xml_node &n)
                            { return has_name(n, name); });
    }

    void collect_items(const pugi::xml_node &parent, const std::string &qualified, std::vector<pugi::xml_node> &items)
    {
      for (pugi::xml_node child : parent.children())
      {
        if (child.type() != pugi::node_element)
          continue;
        if (has_name(child, qualified) || has_name(child, "item"))
          items.push_back(child);
        else
          collect_items(child, qualified, items);
      }
    }

    bool read_text_file(const std::string &path, std::string &out, std::string &err)
    {
      std::ifstream in(path, std::ios::binary);
      if (!in)
      {
        err = "cannot open file";
        return false;
      }
      out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
      if (in.bad())
      {
        err = "read error";
        return false;
      }
      return true;
    }

    bool write_text_file(const std::string &path, const std::string &content, std::string &err)
    {
      std::ofstream out(path, std::ios::binary | std::ios::trunc);
      if (!out)
      {
        err = "cannot open file for writing";
        return false;
      }
      out.write(content.data(), static_cast<std::streamsize>(content.size()));
      out.close();
      if (!out)
      {
        err = "write error";
        return false;
      }
      return true;
    }
  } // namespace

  Dialect dialect_for_path(const std::string &path)
  {
    const std::string name = to_lower(basename_of(path));
    const auto pos = name.find_last_of('.');
    if (pos == std::string::npos)
      return Dialect::None;
    const std::string ext = name.substr(pos + 1);
    if (ext == "htm" || ext == "html" || ext == "xhtml")
      return Dialect::Markup;
    if (ext == "css")
      return Dialect::Style;
    if (ext == "opf")
      return Dialect::Manifest;
    return Dialect::None;
  }

  const char *dialect_name(Dialect dialect)
  {
    switch (dialect)
    {
    case Dialect::Markup:
      return "markup";
    case Dialect::Style:
      return "css";
    case Dialect::Manifest:
      return "manifest";
    default:
      return "none";
    }
  }

  RewriteResult rewrite_markup(const std::string &content, const PathMapping &mapping, const RewriteOptions &opt)
  {
    RewriteResult r;
    const ReferenceMatcher matcher(mapping, opt);
    if (matcher.empty())
    {
      r.content = content;
      return r;
    }

    std::string &out = r.content;
    out.reserve(content.size());
    const size_t n = content.size();
    size_t i = 0;
    while (i < n)
    {
      if (content[i] != '<')
      {
        out += content[i++];
        continue;
      }
      if (content.compare(i, 4, "<!--") == 0)
      {
        i = copy_through(content, i, "-->", out);
        continue;
      }
      if (content.compare(i, 9, "<![CDATA[") == 0)
      {
        i = copy_through(content, i, "]]>", out);
        continue;
      }

      // タグ内: 属性名 = "値" を順に読む
      out += content[i++];
      while (i < n && content[i] != '>')
      {
        if (!is_name_char(content[i]))
        {
          out += content[i++];
          continue;
        }

        const size_t name_begin = i;
        while (i < n && is_name_char(content[i]))
          ++i;
        const std::string name = to_lower(content.substr(name_begin, i - name_begin));
        out.append(content, name_begin, i - name_begin);

        size_t j = i;
        while (j < n && is_space(content[j]))
          ++j;
        if (j >= n || content[j] != '=')
          continue;
        ++j;
        while (j < n && is_space(content[j]))
          ++j;
        if (j >= n || (content[j] != '"' && content[j] != '\''))
        {
          out.append(content, i, j - i);
          i = j;
          continue;
        }

        const char quote = content[j];
        const size_t value_begin = j + 1;
        size_t value_end = content.find(quote, value_begin);
        if (value_end == std::string::npos)
          value_end = n;
        out.append(content, i, value_begin - i);

        const std::string value = content.substr(value_begin, value_end - value_begin);
        std::string replaced;
        if (is_reference_attribute(name) && matcher.remap(value, replaced))
        {
          out += replaced;
          ++r.replacements;
        }
        else
        {
          out += value;
        }
        if (value_end < n)
          out += quote;
        i = value_end < n ? value_end + 1 : n;
      }
      if (i < n)
        out += content[i++];
    }

    r.changed = r.replacements > 0;
    return r;
  }

  RewriteResult rewrite_css(const std::string &content, const PathMapping &mapping, const RewriteOptions &opt)
  {
    RewriteResult r;
    const ReferenceMatcher matcher(mapping, opt);
    if (matcher.empty())
    {
      r.content = content;
      return r;
    }

    std::string &out = r.content;
    out.reserve(content.size());
    const size_t n = content.size();
    size_t i = 0;
    while (i < n)
    {
      const bool at_url = starts_with_ci(content, i, "url(") && (i == 0 || !is_ident_char(content[i - 1]));
      if (!at_url)
      {
        out += content[i++];
        continue;
      }

      size_t j = i + 4;
      while (j < n && is_space(content[j]))
        ++j;

      std::string value;
      size_t close;
      if (j < n && (content[j] == '"' || content[j] == '\''))
      {
        const char quote = content[j];
        const size_t value_end = content.find(quote, j + 1);
        if (value_end == std::string::npos)
        {
          out.append(content, i, n - i);
          break;
        }
        value = content.substr(j + 1, value_end - j - 1);
        close = value_end + 1;
        while (close < n && is_space(content[close]))
          ++close;
        if (close >= n || content[close] != ')')
        {
          out.append(content, i, close - i);
          i = close;
          continue;
        }
      }
      else
      {
        close = content.find(')', j);
        if (close == std::string::npos)
        {
          out.append(content, i, n - i);
          break;
        }
        size_t value_end = close;
        while (value_end > j && is_space(content[value_end - 1]))
          --value_end;
        value = content.substr(j, value_end - j);
      }

      std::string replaced;
      if (matcher.remap(value, replaced))
      {
        out += "url(\"";
        out += replaced;
        out += "\")";
        ++r.replacements;
      }
      else
      {
        out.append(content, i, close + 1 - i);
      }
      i = close + 1;
    }

    r.changed = r.replacements > 0;
    return r;
  }

  bool rewrite_manifest(const std::string &content, const PathMapping &mapping, const RewriteOptions &opt,
                        RewriteResult &out, std::string &err)
  {
    err.clear();
    out = RewriteResult();

    pugi::xml_document doc;
    const unsigned int flags = pugi::parse_cdata | pugi::parse_escapes | pugi::parse_wconv_attribute |
                               pugi::parse_declaration | pugi::parse_doctype | pugi::parse_comments |
                               pugi::parse_pi | pugi::parse_ws_pcdata;
    const pugi::xml_parse_result parsed = doc.load_buffer(content.data(), content.size(), flags, pugi::encoding_utf8);
    if (!parsed)
    {
      std::ostringstream msg;
      msg << "XML parse error: " << parsed.description() << " at offset " << parsed.offset;
      err = msg.str();
      return false;
    }

    const pugi::xml_node root = doc.document_element();
    if (!root)
    {
      err = "empty document";
      return false;
    }

    const std::string prefix = opf_prefix(root);
    pugi::xml_node manifest;
    if (!prefix.empty())
      manifest = find_descendant(root, prefix + ":manifest");
    if (!manifest)
      manifest = find_descendant(root, "manifest");
    if (!manifest)
    {
      err = "manifest element not found";
      return false;
    }

    const ReferenceMatcher matcher(mapping, opt);
    std::vector<pugi::xml_node> items;
    collect_items(manifest, prefix.empty() ? std::string("item") : prefix + ":item", items);
    for (pugi::xml_node &item : items)
    {
      pugi::xml_attribute href = item.attribute("href");
      if (!href)
        continue;
      std::string replaced;
      if (!matcher.remap(href.value(), replaced))
        continue;
      href.set_value(replaced.c_str());
      pugi::xml_attribute media_type = item.attribute("media-type");
      if (media_type && opt.jpeg_media_type == media_type.value())
        media_type.set_value(opt.png_media_type.c_str());
      ++out.replacements;
    }

    if (out.replacements == 0)
    {
      out.content = content;
      return true;
    }

    std::ostringstream oss;
    doc.save(oss, "", pugi::format_raw, pugi::encoding_utf8);
    out.content = oss.str();
    out.changed = true;
    return true;
  }

  bool rewrite_file(const std::string &path, Dialect dialect, const PathMapping &mapping, const RewriteOptions &opt,
                    RewriteResult &out, ErrorKind &kind, std::string &err)
  {
    err.clear();
    kind = ErrorKind::None;
    out = RewriteResult();

    std::string content;
    if (!read_text_file(path, content, err))
    {
      kind = ErrorKind::ReferenceRewriteIO;
      return false;
    }

    switch (dialect)
    {
    case Dialect::Markup:
      out = rewrite_markup(content, mapping, opt);
      break;
    case Dialect::Style:
      out = rewrite_css(content, mapping, opt);
      break;
    case Dialect::Manifest:
      if (!rewrite_manifest(content, mapping, opt, out, err))
      {
        kind = ErrorKind::ManifestParse;
        return false;
      }
      break;
    default:
      kind = ErrorKind::ReferenceRewriteIO;
      err = "no rewriter for this file type";
      return false;
    }

    if (!out.changed)
      return true;
    if (!write_text_file(path, out.content, err))
    {
      kind = ErrorKind::ReferenceRewriteIO;
      return false;
    }
    return true;
  }
} // namespace epubgs
