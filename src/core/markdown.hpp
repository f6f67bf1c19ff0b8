#ifndef MARKDOWN_HPP
#define MARKDOWN_HPP

#include "link_transformer.hpp"
#include <string>

// Minimal host-side body pass: headings, source blocks and bracket links.
// Everything else is copied through untouched.
class MarkdownExporter {
public:
  static std::string from_org(const std::string &body,
                              const LinkRenderer &link_hook);

  static std::string convert_heading(const std::string &line);
  static std::string rewrite_links(const std::string &line,
                                   const LinkRenderer &link_hook);

  static Link parse_target(const std::string &target);
};

#endif
