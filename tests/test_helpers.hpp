//
// test_helpers.hpp
//

#ifndef DOCSCRUB_TEST_HELPERS_HPP
#define DOCSCRUB_TEST_HELPERS_HPP

#include "../libdocscrub/include/file_utils.hpp"
#include "../libdocscrub/include/random_utils.hpp"
#include "../libdocscrub/include/zip_container.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace docscrub::test {

namespace fs = std::filesystem;

using Parts = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Fresh directory under the system temp dir, removed on destruction.
 */
class TempDir {
public:
    TempDir() : root_(fs::temp_directory_path() / ("docscrub_test_" + RandomUtils::random_suffix())) {
        fs::create_directories(root_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return root_; }
    [[nodiscard]] fs::path operator/(const std::string& name) const { return root_ / name; }

private:
    fs::path root_;
};

/**
 * @brief Writes a ZIP archive with the given members, in order.
 */
inline void write_zip(const fs::path& path, const Parts& parts) {
    std::unique_ptr<archive, decltype(&archive_write_free)> out(archive_write_new(), &archive_write_free);
    if (!out || archive_write_set_format_zip(out.get()) != ARCHIVE_OK ||
        archive_write_open_filename(out.get(), path.string().c_str()) != ARCHIVE_OK) {
        throw std::runtime_error("cannot create test archive " + path.string());
    }
    for (const auto& [name, data] : parts) {
        std::unique_ptr<archive_entry, decltype(&archive_entry_free)> entry(archive_entry_new(), &archive_entry_free);
        archive_entry_set_pathname(entry.get(), name.c_str());
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(data.size()));
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), 0644);
        if (archive_write_header(out.get(), entry.get()) != ARCHIVE_OK ||
            archive_write_data(out.get(), data.data(), data.size()) < 0) {
            throw std::runtime_error("cannot write test member " + name);
        }
    }
    if (archive_write_close(out.get()) != ARCHIVE_OK) {
        throw std::runtime_error("cannot close test archive " + path.string());
    }
}

/**
 * @brief Extracts an archive and returns member name -> content.
 */
inline std::map<std::string, std::string> read_zip(const fs::path& path) {
    const TempDir scratch;
    std::map<std::string, std::string> members;
    for (const auto& name : ZipContainer::extract(path, scratch.path())) {
        members[name] = read_file(scratch.path() / fs::path(name));
    }
    return members;
}

inline const std::string content_types =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<Types xmlns="http://schemas.openxmlformats.org/package/2006/content-types">)"
    R"(<Default Extension="xml" ContentType="application/xml"/></Types>)";

inline std::string word_settings(const bool protect) {
    return std::string(R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)")
        + R"(<w:settings xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
        + R"(<w:zoom w:percent="100"/>)"
        + (protect ? R"(<w:documentProtection w:edit="readOnly" w:enforcement="1"/>)" : "")
        + R"(<w:defaultTabStop w:val="720"/></w:settings>)";
}

inline const std::string word_body =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<w:document xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main">)"
    R"(<w:body><w:p><w:r><w:t>Quarterly figures</w:t></w:r></w:p></w:body></w:document>)";

inline const std::string word_header_with_watermark =
    R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)"
    R"(<w:hdr xmlns:w="http://schemas.openxmlformats.org/wordprocessingml/2006/main" xmlns:v="urn:schemas-microsoft-com:vml">)"
    R"(<w:p><w:r><w:pict><v:shape id="PowerPlusWaterMarkObject1" type="#_x0000_t136" )"
    R"(style="position:absolute;rotation:315"><v:textpath string="CONFIDENTIAL"/></v:shape></w:pict></w:r></w:p>)"
    R"(<w:p><w:r><w:t>Header text</w:t></w:r></w:p></w:hdr>)";

/**
 * @brief Minimal .docx package; the settings part optionally carries edit protection.
 */
inline Parts docx_parts(const bool protect, const bool watermark_header) {
    Parts parts = {
        {"[Content_Types].xml", content_types},
        {"word/document.xml", word_body},
        {"word/settings.xml", word_settings(protect)},
    };
    if (watermark_header) {
        parts.emplace_back("word/header1.xml", word_header_with_watermark);
    }
    return parts;
}

inline std::string slide_xml(const std::string& shapes) {
    return std::string(R"(<?xml version="1.0" encoding="UTF-8" standalone="yes"?>)")
        + R"(<p:sld xmlns:a="http://schemas.openxmlformats.org/drawingml/2006/main" )"
        + R"(xmlns:p="http://schemas.openxmlformats.org/presentationml/2006/main">)"
        + R"(<p:cSld><p:spTree><p:nvGrpSpPr><p:cNvPr id="1" name=""/><p:cNvGrpSpPr/><p:nvPr/></p:nvGrpSpPr>)"
        + R"(<p:grpSpPr/>)" + shapes + R"(</p:spTree></p:cSld></p:sld>)";
}

inline std::string text_shape(const int id, const std::string& name, const std::string& text) {
    return R"(<p:sp><p:nvSpPr><p:cNvPr id=")" + std::to_string(id) + R"(" name=")" + name +
           R"("/><p:cNvSpPr/><p:nvPr/></p:nvSpPr><p:spPr/><p:txBody><a:bodyPr/><a:p><a:r><a:t>)" + text +
           R"(</a:t></a:r></a:p></p:txBody></p:sp>)";
}

inline std::string wordart_shape(const int id, const std::string& name, const int alpha) {
    return R"(<p:sp><p:nvSpPr><p:cNvPr id=")" + std::to_string(id) + R"(" name=")" + name +
           R"("/><p:cNvSpPr/><p:nvPr/></p:nvSpPr><p:spPr/><p:txBody><a:bodyPr fromWordArt="1"/>)"
           R"(<a:p><a:r><a:rPr><a:solidFill><a:srgbClr val="C0C0C0"><a:alpha val=")" + std::to_string(alpha) +
           R"("/></a:srgbClr></a:solidFill></a:rPr><a:t>DRAFT</a:t></a:r></a:p></p:txBody></p:sp>)";
}

/**
 * @brief Writes a PDF with one page per content stream.
 * @param encrypt_with_owner_password non-empty: AES-256 with an empty user password.
 */
inline void write_pdf(const fs::path& path,
                      const std::vector<std::string>& page_contents,
                      const std::string& encrypt_with_owner_password = "",
                      const std::string& user_password = "") {
    QPDF pdf;
    pdf.emptyPDF();

    auto font = pdf.makeIndirectObject(QPDFObjectHandle::parse(
        "<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>"));
    auto fonts = QPDFObjectHandle::newDictionary();
    fonts.replaceKey("/F1", font);
    auto resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/Font", fonts);
    resources = pdf.makeIndirectObject(resources);

    QPDFPageDocumentHelper pages(pdf);
    for (const auto& content : page_contents) {
        auto page = pdf.makeIndirectObject(QPDFObjectHandle::parse("<< /Type /Page /MediaBox [0 0 612 792] >>"));
        page.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, content));
        page.replaceKey("/Resources", resources);
        pages.addPage(QPDFPageObjectHelper(page), false);
    }

    QPDFWriter writer(pdf, path.string().c_str());
    writer.setStaticID(true);
    if (!encrypt_with_owner_password.empty()) {
        writer.setR6EncryptionParameters(user_password.c_str(), encrypt_with_owner_password.c_str(),
                                         true, false, true, false, false, false,
                                         qpdf_r3p_none, true);
    }
    writer.write();
}

/**
 * @brief Decoded content streams of every page, concatenated per page.
 */
inline std::vector<std::string> read_pdf_pages(const fs::path& path) {
    QPDF pdf;
    pdf.processFile(path.string().c_str());
    std::vector<std::string> out;
    for (auto& page : QPDFPageDocumentHelper(pdf).getAllPages()) {
        std::string joined;
        for (auto& stream : page.getPageContents()) {
            const auto buf = stream.getStreamData(qpdf_dl_generalized);
            joined.append(reinterpret_cast<const char*>(buf->getBuffer()), buf->getSize());
        }
        out.push_back(std::move(joined));
    }
    return out;
}

inline bool pdf_is_encrypted(const fs::path& path) {
    QPDF pdf;
    pdf.processFile(path.string().c_str());
    return pdf.isEncrypted();
}

} // namespace docscrub::test

#endif // DOCSCRUB_TEST_HELPERS_HPP
