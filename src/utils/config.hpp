#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "core/meta_value.hpp"
#include <cmath>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

class PublishConfig {
private:
  static MetaValue yaml_to_meta(const std::string &key, const YAML::Node &node) {
    if (node.IsNull()) {
      return MetaValue();
    }

    if (node.IsScalar()) {
      // Quoted scalars carry the "!" tag and stay strings.
      double number = 0;
      if (node.Tag() != "!" && YAML::convert<double>::decode(node, number) &&
          std::isfinite(number)) {
        return MetaValue::number(number);
      }
      return MetaValue::string(node.as<std::string>());
    }

    if (node.IsSequence()) {
      std::vector<MetaValue> items;
      for (const auto &item : node) {
        items.push_back(yaml_to_meta(key, item));
      }
      return MetaValue::list(std::move(items));
    }

    throw std::runtime_error("Config error: defaults." + key +
                             " must be a scalar or a list");
  }

public:
  std::string content_dir = "notes";
  std::string output_dir = "public";
  std::string publish_dir = "posts";
  std::string link_class = "internal-link";

  std::vector<std::string> fields = {"title",   "date", "last_updated_at",
                                     "aliases", "tags", "category"};

  // Front-matter values for fields a note does not set itself.
  std::map<std::string, MetaValue> defaults;

  static PublishConfig load(const fs::path &config_path) {
    PublishConfig config;

    if (!fs::exists(config_path)) {
      return config;
    }

    YAML::Node yaml;
    try {
      yaml = YAML::LoadFile(config_path.string());
    } catch (const YAML::Exception &e) {
      throw std::runtime_error("Config error: " + std::string(e.what()));
    }

    return from_yaml(yaml);
  }

  static PublishConfig from_yaml(const YAML::Node &yaml) {
    PublishConfig config;

    if (!yaml.IsDefined() || yaml.IsNull()) {
      return config;
    }
    if (!yaml.IsMap()) {
      throw std::runtime_error("Config error: top level must be a map");
    }

    try {
      if (yaml["content_dir"])
        config.content_dir = yaml["content_dir"].as<std::string>();
      if (yaml["output_dir"])
        config.output_dir = yaml["output_dir"].as<std::string>();
      if (yaml["publish_dir"])
        config.publish_dir = yaml["publish_dir"].as<std::string>();
      if (yaml["link_class"])
        config.link_class = yaml["link_class"].as<std::string>();
      if (yaml["fields"])
        config.fields = yaml["fields"].as<std::vector<std::string>>();

      if (yaml["defaults"]) {
        for (auto it = yaml["defaults"].begin(); it != yaml["defaults"].end();
             ++it) {
          std::string key = it->first.as<std::string>();
          config.defaults[key] = yaml_to_meta(key, it->second);
        }
      }
    } catch (const YAML::Exception &e) {
      throw std::runtime_error("Config error: " + std::string(e.what()));
    }

    return config;
  }

  fs::path publish_path(const fs::path &project_root) const {
    return project_root / output_dir / publish_dir;
  }
};

#endif
