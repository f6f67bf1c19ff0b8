#include "link_transformer.hpp"
#include <utility>

LinkTransformer::LinkTransformer(std::string style_class,
                                 ReferenceResolver resolver,
                                 LinkRenderer fallback)
    : style_class(std::move(style_class)), resolver(std::move(resolver)),
      fallback(std::move(fallback)) {}

bool LinkTransformer::is_internal(const Link &link) {
  return link.type == SCHEME;
}

ResolvedReference LinkTransformer::split_reference(const std::string &path) {
  ResolvedReference ref;
  size_t sep = path.find("::");

  if (sep == std::string::npos) {
    ref.identifier = path;
    return ref;
  }

  ref.identifier = path.substr(0, sep);
  std::string query = path.substr(sep + 2);
  if (!query.empty()) {
    ref.query = query;
  }
  return ref;
}

std::string LinkTransformer::escape_html(const std::string &text) {
  std::string result;
  result.reserve(text.size());

  for (char c : text) {
    switch (c) {
    case '&':
      result += "&amp;";
      break;
    case '<':
      result += "&lt;";
      break;
    case '>':
      result += "&gt;";
      break;
    case '"':
      result += "&quot;";
      break;
    default:
      result += c;
    }
  }
  return result;
}

std::string
LinkTransformer::render_anchor(const ResolvedReference &ref,
                               const std::optional<std::string> &label,
                               const std::string &style_class) {
  std::string text;
  if (label && !label->empty()) {
    text = *label;
  } else if (ref.query) {
    text = ref.identifier + "::" + *ref.query;
  } else {
    text = ref.identifier;
  }

  std::string href = std::string(SCHEME) + ":" + ref.identifier + ".html";
  if (ref.query) {
    href += *ref.query;
  }

  return "<a href=\"" + escape_html(href) + "\" class=\"" +
         escape_html(style_class) + "\">" + escape_html(text) + "</a>";
}

std::string
LinkTransformer::render_markdown_link(const Link &link,
                                      const std::optional<std::string> &label) {
  std::string target = link.path;
  if (!link.type.empty() && link.type != "file") {
    target = link.type + ":" + link.path;
  }

  std::string text = (label && !label->empty()) ? *label : target;
  return "[" + text + "](" + target + ")";
}

std::string LinkTransformer::render(const Link &link,
                                    const std::optional<std::string> &label) const {
  if (!is_internal(link)) {
    return fallback(link, label);
  }

  return render_anchor(resolver(link.path), label, style_class);
}

LinkRenderer LinkTransformer::hook() const {
  return [transformer = *this](const Link &link,
                               const std::optional<std::string> &label) {
    return transformer.render(link, label);
  };
}

std::string render_link(const Link &link,
                        const std::optional<std::string> &label,
                        const std::string &style_class) {
  return LinkTransformer(style_class, LinkTransformer::split_reference)
      .render(link, label);
}
