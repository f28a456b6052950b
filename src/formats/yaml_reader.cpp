/**
 * MatBridge - Unity YAML Documents Implementation
 */

#include "matbridge/yaml_reader.hpp"
#include "matbridge/path_utils.hpp"
#include "matbridge/logging.hpp"

namespace matbridge {

namespace {

struct PendingDocument {
    std::string tag;
    std::string anchor;
    bool stripped = false;
    bool opened = false;        // Seen a "---" header
    size_t first_line = 1;      // 1-based line of the body start
    std::string body;
};

// Reads "--- !u!21 &2100000 stripped". Anything that is not a tag, anchor
// or the stripped marker starts the document body.
void read_header(std::string_view rest, PendingDocument& doc) {
    while (!rest.empty()) {
        rest = trim(rest);
        if (rest.empty()) break;

        size_t end = rest.find_first_of(" \t");
        std::string_view token = rest.substr(0, end);

        if (token.front() == '!') {
            doc.tag = std::string(token);
        } else if (token.front() == '&') {
            doc.anchor = std::string(token.substr(1));
        } else if (token == "stripped") {
            doc.stripped = true;
        } else {
            doc.body.append(rest);
            doc.body.push_back('\n');
            break;
        }

        rest = end == std::string_view::npos ? std::string_view() : rest.substr(end);
    }
}

} // namespace

Result<std::vector<YamlDocument>> parse_yaml_documents(std::string_view text) {
    if (text.starts_with("\xEF\xBB\xBF")) text.remove_prefix(3);

    std::vector<YamlDocument> docs;
    PendingDocument pending;

    auto flush = [&]() -> Result<void> {
        if (!pending.opened && trim(pending.body).empty()) {
            pending = PendingDocument{};
            return Result<void>::success();
        }

        try {
            docs.push_back(YamlDocument{pending.tag, pending.anchor, pending.stripped, YAML::Load(pending.body)});
        } catch (const YAML::Exception& e) {
            size_t line = pending.first_line + (e.mark.line >= 0 ? static_cast<size_t>(e.mark.line) : 0);
            return Error::parse_error(e.msg, "line " + std::to_string(line));
        }
        pending = PendingDocument{};
        return Result<void>::success();
    };

    size_t line_number = 0;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = text.substr(start, end - start);
        if (line.ends_with('\r')) line.remove_suffix(1);
        start = end + 1;
        line_number++;

        if (line.starts_with("---")) {
            TRY(flush());
            pending.opened = true;
            pending.first_line = line_number + 1;
            read_header(line.substr(3), pending);
            continue;
        }
        if (line == "...") {
            TRY(flush());
            continue;
        }
        if (line.starts_with('%') && trim(pending.body).empty()) {
            continue;
        }

        if (pending.body.empty() && !pending.opened) pending.first_line = line_number;
        pending.body.append(line);
        pending.body.push_back('\n');
    }
    TRY(flush());

    LOG_DEBUG("Yaml", "Parsed " << docs.size() << " documents");
    return docs;
}

const YamlDocument* find_document(const std::vector<YamlDocument>& docs, std::string_view type) {
    for (const auto& doc : docs) {
        if (yaml_child(doc.root, type)) return &doc;
    }
    return nullptr;
}

YAML::Node yaml_child(const YAML::Node& node, std::string_view key) {
    if (!node || !node.IsMap()) return YAML::Node(YAML::NodeType::Undefined);

    // yaml-cpp keeps every duplicate key; the last one wins here
    std::optional<YAML::Node> found;
    for (const auto& entry : node) {
        if (entry.first.IsScalar() && entry.first.Scalar() == key) {
            found.emplace(entry.second);
        }
    }
    return found ? *found : YAML::Node(YAML::NodeType::Undefined);
}

std::string yaml_text(const YAML::Node& node) {
    if (!node || !node.IsScalar()) return {};
    return node.Scalar();
}

std::optional<double> yaml_number(const YAML::Node& node) {
    if (!node || !node.IsScalar()) return std::nullopt;

    double value = 0.0;
    if (!YAML::convert<double>::decode(node, value)) return std::nullopt;
    return value;
}

} // namespace matbridge
