#ifndef LINK_TRANSFORMER_HPP
#define LINK_TRANSFORMER_HPP

#include <functional>
#include <optional>
#include <string>

// A link as the body exporter sees it: "[[denote:2024...::heading][label]]"
// arrives as {type = "denote", path = "2024...::heading"}.
struct Link {
  std::string type;
  std::string path;
};

struct ResolvedReference {
  std::string identifier;
  std::optional<std::string> query;
};

using ReferenceResolver =
    std::function<ResolvedReference(const std::string &path)>;

using LinkRenderer = std::function<std::string(
    const Link &link, const std::optional<std::string> &label)>;

class LinkTransformer {
public:
  static constexpr const char *SCHEME = "denote";

  LinkTransformer(std::string style_class, ReferenceResolver resolver,
                  LinkRenderer fallback = render_markdown_link);

  std::string render(const Link &link,
                     const std::optional<std::string> &label) const;

  // Callback form handed to the body exporter. The transformer is copied
  // into it.
  LinkRenderer hook() const;

  static bool is_internal(const Link &link);

  // "ID" -> {ID}, "ID::query" -> {ID, query}. An empty query is no query.
  static ResolvedReference split_reference(const std::string &path);

  static std::string render_anchor(const ResolvedReference &ref,
                                   const std::optional<std::string> &label,
                                   const std::string &style_class);

  static std::string render_markdown_link(const Link &link,
                                          const std::optional<std::string> &label);

  static std::string escape_html(const std::string &text);

private:
  std::string style_class;
  ReferenceResolver resolver;
  LinkRenderer fallback;
};

std::string render_link(const Link &link,
                        const std::optional<std::string> &label,
                        const std::string &style_class);

#endif
