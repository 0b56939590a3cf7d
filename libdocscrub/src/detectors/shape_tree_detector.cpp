//
// shape_tree_detector.cpp
//

#include "../../include/shape_tree_detector.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include "../../include/text_utils.hpp"
#include <pugixml.hpp>
#include <algorithm>
#include <charconv>

namespace docscrub {

namespace {

constexpr std::string_view presentationml_ns = "http://schemas.openxmlformats.org/presentationml/2006/main";
constexpr std::string_view drawingml_ns = "http://schemas.openxmlformats.org/drawingml/2006/main";
constexpr int opaque_alpha = 100000;

/**
 * Qualified names for the elements the detector cares about, built from
 * the prefixes the slide actually binds.
 */
struct SlideNames {
    std::string sp_tree;
    std::string sp;
    std::string nv_sp_pr;
    std::string c_nv_pr;
    std::string body_pr;
    std::string alpha;

    SlideNames(const std::string& p, const std::string& a)
        : sp_tree(qualify(p, "spTree")),
          sp(qualify(p, "sp")),
          nv_sp_pr(qualify(p, "nvSpPr")),
          c_nv_pr(qualify(p, "cNvPr")),
          body_pr(qualify(a, "bodyPr")),
          alpha(qualify(a, "alpha")) {}

    static std::string qualify(const std::string& prefix, const char* local) {
        return prefix.empty() ? std::string(local) : prefix + ":" + local;
    }
};

// prefix bound to `uri` on the root element, `fallback` if none
std::string prefix_for(const pugi::xml_node root, const std::string_view uri, const char* fallback) {
    for (const auto attr : root.attributes()) {
        const std::string_view name = attr.name();
        if (uri != attr.value()) continue;
        if (name == "xmlns") return {};
        if (name.starts_with("xmlns:")) return std::string(name.substr(6));
    }
    return fallback;
}

pugi::xml_node find_descendant(const pugi::xml_node from, const std::string& qname) {
    return from.find_node([&qname](const pugi::xml_node n) { return qname == n.name(); });
}

std::optional<int> parse_int(const std::string_view s) {
    int v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
    return v;
}

// lowest alpha inside the shape, opaque when none is given
int lowest_alpha(const pugi::xml_node node, const std::string& alpha_name) {
    int lowest = opaque_alpha;
    for (const auto child : node.children()) {
        if (alpha_name == child.name()) {
            const auto val = child.attribute("val");
            const auto parsed = val ? parse_int(val.value()) : std::optional<int>(opaque_alpha);
            if (parsed) lowest = std::min(lowest, *parsed);
        }
        lowest = std::min(lowest, lowest_alpha(child, alpha_name));
    }
    return lowest;
}

struct XmlStringWriter : pugi::xml_writer {
    std::string out;
    void write(const void* data, const size_t size) override {
        out.append(static_cast<const char*>(data), size);
    }
};

} // namespace

ShapeTreeDetector::ShapeTreeDetector(const SanitizeOptions& options) : options_(options) {}

SlideScan ShapeTreeDetector::scan_slide(const std::string_view slide_xml,
                                        const std::string& part_name,
                                        const std::size_t slide_index,
                                        const bool excise) const {
    pugi::xml_document doc;
    const auto parsed = doc.load_buffer(slide_xml.data(), slide_xml.size(),
                                        pugi::parse_full | pugi::parse_ws_pcdata, pugi::encoding_utf8);
    if (!parsed) {
        throw SanitizeError(ErrorKind::CorruptContainer,
                            "cannot parse " + part_name + ": " + parsed.description() +
                            " at offset " + std::to_string(parsed.offset));
    }

    const auto root = doc.document_element();
    const SlideNames names(prefix_for(root, presentationml_ns, "p"), prefix_for(root, drawingml_ns, "a"));

    SlideScan scan;
    auto tree = find_descendant(root, names.sp_tree);
    if (!tree) {
        Logger::log(LogLevel::Debug, part_name + " has no shape tree", "ShapeTreeDetector");
        return scan;
    }

    std::vector<pugi::xml_node> doomed;
    std::size_t ordinal = 0;
    for (const auto sp : tree.children(names.sp.c_str())) {
        ++ordinal;
        ++scan.shapes_scanned;

        std::optional<WatermarkKind> kind;
        const std::string shape_name = sp.child(names.nv_sp_pr.c_str())
                                         .child(names.c_nv_pr.c_str())
                                         .attribute("name").as_string();
        for (const auto& pattern : options_.name_patterns) {
            if (!pattern.empty() && icontains(shape_name, pattern)) {
                kind = NamedShape{pattern, shape_name};
                break;
            }
        }

        if (!kind && options_.detect_wordart) {
            const auto body_pr = find_descendant(sp, names.body_pr);
            if (body_pr && std::string_view(body_pr.attribute("fromWordArt").as_string()) == "1") {
                const int alpha = lowest_alpha(sp, names.alpha);
                if (alpha < options_.alpha_threshold) {
                    kind = TransparentWordArt{alpha};
                }
            }
        }

        if (kind) {
            scan.candidates.push_back({*kind, ArtifactLocation{slide_index, part_name, ordinal}});
            doomed.push_back(sp);
        }
    }

    if (excise && !doomed.empty()) {
        for (const auto sp : doomed) {
            tree.remove_child(sp);
        }
        XmlStringWriter writer;
        doc.save(writer, "", pugi::format_raw | pugi::format_no_declaration, pugi::encoding_utf8);
        scan.rewritten = std::move(writer.out);
        scan.changed = true;
    }
    return scan;
}

std::optional<std::size_t> ShapeTreeDetector::slide_index(const std::string_view part_name) {
    constexpr std::string_view prefix = "ppt/slides/slide";
    constexpr std::string_view suffix = ".xml";
    if (!part_name.starts_with(prefix) || !part_name.ends_with(suffix)) return std::nullopt;

    const auto digits = part_name.substr(prefix.size(), part_name.size() - prefix.size() - suffix.size());
    if (digits.empty()) return std::nullopt;
    std::size_t v = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), v);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) return std::nullopt;
    return v;
}

std::vector<std::string> ShapeTreeDetector::order_slides(const std::vector<std::string>& part_names) {
    std::vector<std::pair<std::size_t, std::string>> indexed;
    for (const auto& name : part_names) {
        if (const auto idx = slide_index(name)) {
            indexed.emplace_back(*idx, name);
        }
    }
    std::ranges::sort(indexed);

    std::vector<std::string> ordered;
    ordered.reserve(indexed.size());
    for (auto& [idx, name] : indexed) {
        ordered.push_back(std::move(name));
    }
    return ordered;
}

} // namespace docscrub
