/**
 * MatBridge - Godot .tres Writer Implementation
 */

#include "matbridge/tres_writer.hpp"
#include "matbridge/shader_tables.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <locale>
#include <map>
#include <sstream>
#include <tuple>

namespace matbridge {

namespace {

constexpr std::string_view UNNAMED_MATERIAL = "unnamed_material";

std::string join_resource_path(std::string_view base, std::string_view file) {
    std::string path(base);
    while (!path.empty() && path.back() == '/') path.pop_back();
    if (path.empty() || path.back() == ':') return path + "//" + std::string(file);
    return path + "/" + std::string(file);
}

std::string escape_quoted(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

template<typename T>
std::vector<const T*> sorted_by_rank(const std::vector<T>& items, ShaderFamily family,
                                     const std::string T::*name) {
    std::vector<const T*> sorted;
    sorted.reserve(items.size());
    for (const auto& item : items) sorted.push_back(&item);

    std::stable_sort(sorted.begin(), sorted.end(), [&](const T* a, const T* b) {
        return std::make_tuple(uniform_rank(family, a->*name), a->*name) <
               std::make_tuple(uniform_rank(family, b->*name), b->*name);
    });
    return sorted;
}

} // namespace

std::string format_float(float value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";

    std::ostringstream ss;
    ss.imbue(std::locale::classic());
    ss << std::fixed << std::setprecision(6) << value;
    std::string text = ss.str();

    size_t dot = text.find('.');
    if (dot != std::string::npos) {
        size_t last = text.find_last_not_of('0');
        if (last == dot) last++;     // keep one decimal
        text.erase(last + 1);
    }

    if (text == "-0.0") return "0.0";
    return text;
}

std::string format_color(const glm::vec4& color) {
    return "Color(" + format_float(color.r) + ", " + format_float(color.g) + ", " +
           format_float(color.b) + ", " + format_float(color.a) + ")";
}

std::string format_vector2(const glm::vec2& vec) {
    return "Vector2(" + format_float(vec.x) + ", " + format_float(vec.y) + ")";
}

std::string sanitize_filename(std::string_view name) {
    std::string result;
    result.reserve(name.size());

    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        bool invalid = uc < 0x20 || uc == 0x7f || c == '<' || c == '>' || c == ':' || c == '"' ||
                       c == '/' || c == '\\' || c == '|' || c == '?' || c == '*';
        char out = invalid ? '_' : c;
        if (out == '_' && !result.empty() && result.back() == '_') continue;
        result.push_back(out);
    }

    auto strip = [](char c) { return c == '_' || c == ' ' || c == '\t' || c == '\n'; };
    size_t start = 0;
    while (start < result.size() && strip(result[start])) start++;
    size_t end = result.size();
    while (end > start && strip(result[end - 1])) end--;
    result = result.substr(start, end - start);

    if (result.empty()) return std::string(UNNAMED_MATERIAL);
    return result;
}

std::string serialize_tres(const MappedMaterial& mapped, const TresOptions& options) {
    auto textures = sorted_by_rank(mapped.textures, mapped.family, &TextureBinding::slot);
    auto uniforms = sorted_by_rank(mapped.uniforms, mapped.family, &Uniform::name);

    // Kind order: bool, float, color, vector (variant index order)
    std::stable_sort(uniforms.begin(), uniforms.end(), [](const Uniform* a, const Uniform* b) {
        return a->value.index() < b->value.index();
    });

    // Texture file -> ext_resource id; the shader is id 1
    std::vector<std::string> files;
    std::map<std::string, int> file_ids;
    std::vector<int> binding_ids;
    for (const TextureBinding* binding : textures) {
        std::string file = binding->filename ? *binding->filename : std::string(MISSING_TEXTURE_FILE);
        auto [it, inserted] = file_ids.emplace(file, static_cast<int>(files.size()) + 2);
        if (inserted) files.push_back(file);
        binding_ids.push_back(it->second);
    }

    std::ostringstream out;
    out.imbue(std::locale::classic());

    out << "[gd_resource type=\"ShaderMaterial\" load_steps=" << (files.size() + 2) << " format=3]\n\n";

    out << "[ext_resource type=\"Shader\" path=\""
        << escape_quoted(join_resource_path(options.shader_base, family_shader_file(mapped.family)))
        << "\" id=\"1\"]\n";
    for (size_t i = 0; i < files.size(); i++) {
        out << "[ext_resource type=\"Texture2D\" path=\""
            << escape_quoted(join_resource_path(options.texture_base, files[i]))
            << "\" id=\"" << (i + 2) << "\"]\n";
    }

    out << "\n[resource]\n";
    out << "shader = ExtResource(\"1\")\n";

    for (size_t i = 0; i < textures.size(); i++) {
        out << "shader_parameter/" << textures[i]->slot << " = ExtResource(\"" << binding_ids[i] << "\")\n";
    }

    for (const Uniform* uniform : uniforms) {
        out << "shader_parameter/" << uniform->name << " = ";
        if (auto b = std::get_if<bool>(&uniform->value)) {
            out << (*b ? "true" : "false");
        } else if (auto f = std::get_if<float>(&uniform->value)) {
            out << format_float(*f);
        } else if (auto c = std::get_if<glm::vec4>(&uniform->value)) {
            out << format_color(*c);
        } else if (auto v = std::get_if<glm::vec2>(&uniform->value)) {
            out << format_vector2(*v);
        }
        out << "\n";
    }

    return out.str();
}

} // namespace matbridge
