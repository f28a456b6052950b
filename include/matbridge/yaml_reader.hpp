/**
 * MatBridge - Unity YAML Documents
 *
 * Unity serializes assets as a stream of documents, each opened by a
 * "--- !u!<class> &<fileID>" header (optionally followed by "stripped").
 * The headers are split off here; the document bodies go to yaml-cpp.
 * Node tags inside a body are ignored.
 */

#pragma once

#include "matbridge/result.hpp"
#include <yaml-cpp/yaml.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matbridge {

struct YamlDocument {
    std::string tag;        // e.g. "!u!21"
    std::string anchor;     // e.g. "2100000"
    bool stripped = false;
    YAML::Node root;
};

/**
 * Parse every document in a stream. A leading UTF-8 BOM and %YAML / %TAG
 * directives are skipped. Malformed bodies fail with ParseError.
 */
Result<std::vector<YamlDocument>> parse_yaml_documents(std::string_view text);

/**
 * First document whose root mapping has `type` as a key ("Material").
 */
const YamlDocument* find_document(const std::vector<YamlDocument>& docs, std::string_view type);

/**
 * Child of a mapping by key; a repeated key resolves to its last
 * occurrence. Undefined when `node` is not a mapping or has no such key.
 */
YAML::Node yaml_child(const YAML::Node& node, std::string_view key);

/**
 * Scalar text, empty for other kinds.
 */
std::string yaml_text(const YAML::Node& node);

/**
 * Scalar as a number, nullopt for non-scalars and non-numeric text.
 */
std::optional<double> yaml_number(const YAML::Node& node);

} // namespace matbridge
