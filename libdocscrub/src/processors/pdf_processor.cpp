//
// pdf_processor.cpp
//

#include "../../include/pdf_processor.hpp"
#include "../../include/content_stream_detector.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFObjGen.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <memory>
#include <ostream>
#include <set>
#include <sstream>
#include <string>
#include <system_error>

namespace {

const char* processor_tag() {
    return "PdfProcessor";
}

// helper: custom streambuf to redirect qpdf messages into our logger
struct LoggerStreamBuf final : std::stringbuf {
    LogLevel level;
    std::string module;
    LoggerStreamBuf(const LogLevel lvl, const char* mod) : level(lvl), module(mod) {}
    int sync() override {
        std::string s = str();
        while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
        if (!s.empty()) {
            Logger::log(level, s, module);
        }
        str("");
        return 0;
    }
    ~LoggerStreamBuf() override { LoggerStreamBuf::sync(); }
};

/**
 * An open document together with the streams its logger writes to.
 * Members are declared so that the QPDF instance is destroyed before the
 * streams its logger points at.
 */
struct PdfSession {
    LoggerStreamBuf info_buf{LogLevel::Debug, "qpdf"};
    LoggerStreamBuf warn_buf{LogLevel::Warning, "qpdf"};
    std::ostream info_os{&info_buf};
    std::ostream warn_os{&warn_buf};
    std::unique_ptr<QPDF> pdf;

    void open(const std::filesystem::path& path, const char* password) {
        pdf = std::make_unique<QPDF>();
        auto qlogger = QPDFLogger::create();
        qlogger->setOutputStreams(&info_os, &warn_os);
        pdf->setLogger(qlogger);
        pdf->processFile(path.string().c_str(), password);
    }
};

// opens `path`, retrying once with an explicit empty password
void open_with_retry(PdfSession& session, const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    try {
        session.open(path, nullptr);
        return;
    } catch (const QPDFExc& e) {
        if (e.getErrorCode() != qpdf_e_password) {
            throw docscrub::SanitizeError(docscrub::ErrorKind::CorruptContainer,
                                          "cannot parse PDF " + name + ": " + e.what());
        }
        Logger::log(LogLevel::Debug, "Password required, retrying with an empty password", processor_tag());
    }

    try {
        session.open(path, "");
    } catch (const QPDFExc& e) {
        if (e.getErrorCode() == qpdf_e_password) {
            throw docscrub::SanitizeError(docscrub::ErrorKind::EncryptedDocument,
                                          name + " requires a user password");
        }
        throw docscrub::SanitizeError(docscrub::ErrorKind::CorruptContainer,
                                      "cannot parse PDF " + name + ": " + e.what());
    }
}

} // namespace

namespace docscrub {

ProcessResult PdfProcessor::process(const Document& doc,
                                    const std::filesystem::path& output_path,
                                    const SanitizeOptions& options,
                                    const ProgressCallback& progress) {
    Logger::log(LogLevel::Info, "Processing PDF: " + doc.path.filename().string(), processor_tag());

    PdfSession session;
    open_with_retry(session, doc.path);
    QPDF& pdf = *session.pdf;

    const bool apply = options.is_apply();
    ArtifactTally tally;

    if (pdf.isEncrypted() && options.wants_protection()) {
        Logger::log(LogLevel::Info, "Opened with empty user password, owner restrictions will be dropped",
                    processor_tag());
        tally.add_label("pdf-owner-restrictions");
    }

    auto pages = QPDFPageDocumentHelper(pdf).getAllPages();
    const ContentStreamDetector detector(options);
    std::set<QPDFObjGen> visited;

    for (std::size_t i = 0; i < pages.size(); ++i) {
        const std::size_t page_no = i + 1;
        if (progress) progress(page_no, pages.size(), "page " + std::to_string(page_no));
        if (!options.wants_watermarks()) continue;

        for (auto& stream : pages[i].getPageContents()) {
            if (!stream.isStream()) continue;
            if (stream.isIndirect() && !visited.insert(stream.getObjGen()).second) continue;

            std::string data;
            try {
                const std::shared_ptr<Buffer> buf = stream.getStreamData(qpdf_dl_generalized);
                data.assign(reinterpret_cast<const char*>(buf->getBuffer()), buf->getSize());
            } catch (const QPDFExc& e) {
                Logger::log(LogLevel::Warning,
                            "Page " + std::to_string(page_no) + ": content stream not decodable, left as is (" +
                            e.what() + ")",
                            processor_tag());
                continue;
            }

            const auto scan = detector.scan(data, page_no, apply);
            tally.add_scanned(scan.blocks_scanned);
            for (const auto& candidate : scan.candidates) {
                tally.add(candidate);
            }
            if (scan.changed) {
                stream.replaceStreamData(scan.rewritten, QPDFObjectHandle::newNull(), QPDFObjectHandle::newNull());
            }
        }
    }

    std::optional<std::filesystem::path> written;
    if (apply) {
        if (tally.removed_count() > 0) {
            const auto staged = staging_path_for(output_path);
            try {
                QPDFWriter writer(pdf, staged.string().c_str());
                // owner restrictions are a protection artifact; keep them unless protection is targeted
                const bool keep_encryption = pdf.isEncrypted() && !options.wants_protection();
                writer.setPreserveEncryption(keep_encryption);
                if (!keep_encryption) {
                    writer.setDeterministicID(true);
                }
                writer.write();
            } catch (const std::exception& e) {
                std::error_code ec;
                std::filesystem::remove(staged, ec);
                throw SanitizeError(ErrorKind::IOFailure,
                                    "cannot write " + output_path.string() + ": " + e.what());
            }
            commit_staged_file(staged, output_path);
        } else {
            Logger::log(LogLevel::Info, "Nothing to remove, copying input unchanged", processor_tag());
            copy_to_output(doc.path, output_path);
        }
        written = output_path;
    }

    auto result = tally.to_result(options.mode, written, pages.size());
    Logger::log(LogLevel::Info, doc.path.filename().string() + ": " + result.message, processor_tag());
    return result;
}

} // namespace docscrub
