//
// process_result.cpp
//

#include "../../include/process_result.hpp"
#include <iomanip>
#include <sstream>

namespace docscrub {

namespace {

// overload set for std::visit
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };

} // namespace

std::string describe(const WatermarkKind& kind) {
    return std::visit(overloaded{
        [](const RotatedText& r) {
            std::ostringstream oss;
            oss << "rotated(" << std::fixed << std::setprecision(1) << r.angle << "°)";
            return oss.str();
        },
        [](const KeywordMatch& k) {
            return "keyword(" + k.keyword + ")";
        },
        [](const NamedShape& n) {
            return "name contains \"" + n.pattern + "\"";
        },
        [](const TransparentWordArt&) {
            return std::string("wordart+transparent");
        },
        [](const BackgroundFill&) {
            return std::string("background-fill");
        },
        [](const VmlWatermark& v) {
            return "vml-watermark(" + v.signature + ")";
        },
        [](const BackgroundPicture&) {
            return std::string("background-picture");
        }
    }, kind);
}

std::string describe(const ProtectionMarker& marker) {
    return "protection(" + marker.tag + ")";
}

ProcessResult ProcessResult::failure(const ErrorKind kind, const std::string& message) {
    ProcessResult r;
    r.success = false;
    r.message = message;
    r.error = kind;
    return r;
}

void ArtifactTally::add(const WatermarkCandidate& candidate) {
    ++removed_;
    labels_.insert(describe(candidate.kind));
    watermarks_.push_back(candidate);
}

void ArtifactTally::add(const ProtectionMarker& marker) {
    ++removed_;
    labels_.insert(describe(marker));
    markers_.push_back(marker);
}

void ArtifactTally::add_label(const std::string& label) {
    ++removed_;
    labels_.insert(label);
}

ProcessResult ArtifactTally::to_result(const RunMode mode,
                                       std::optional<std::filesystem::path> output_path,
                                       const std::size_t page_count) const {
    ProcessResult r;
    r.success = true;
    r.output_path = std::move(output_path);
    r.removed_count = removed_;
    r.page_count = page_count;
    r.scanned_count = scanned_;
    r.detected_patterns = labels_;
    r.message = summarize(mode, removed_, labels_);
    return r;
}

std::string summarize(const RunMode mode, const std::size_t removed, const std::set<std::string>& labels) {
    std::ostringstream oss;
    if (mode == RunMode::Scan) {
        oss << "scan complete: found " << removed << " artifact(s)";
    } else {
        oss << "apply complete: removed " << removed << " artifact(s)";
    }
    oss << " [";
    if (labels.empty()) {
        oss << "none";
    } else {
        bool first = true;
        for (const auto& l : labels) {
            if (!first) oss << ", ";
            oss << l;
            first = false;
        }
    }
    oss << "]";
    return oss.str();
}

} // namespace docscrub
