#include "../../include/artifact_reader.hpp"
#include "../../include/logger.hpp"

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include <array>
#include <ostream>
#include <sstream>
#include <vector>

namespace texharvest {

namespace {

constexpr const char* kTag = "ArtifactReader";

// Kerning adjustments wider than this (thousandths of an em) read as a word gap.
constexpr double kWordGap = -200.0;

// Redirects qpdf diagnostics into the Logger.
struct LoggerStreamBuf final : std::stringbuf {
    LogLevel level;
    std::string module;
    LoggerStreamBuf(const LogLevel lvl, const char* mod) : level(lvl), module(mod) {}
    int sync() override {
        std::string s = str();
        while (!s.empty() && s.back() == '\n') s.pop_back();
        if (!s.empty()) {
            Logger::log(level, s, module);
        }
        str("");
        return 0;
    }
    ~LoggerStreamBuf() override { LoggerStreamBuf::sync(); }
};

// Collects operands until the operator that consumes them.
class TextCollector final : public QPDFObjectHandle::ParserCallbacks {
public:
    explicit TextCollector(std::string& out) : out_(out) {}

    void handleObject(QPDFObjectHandle obj) override {
        if (!obj.isOperator()) {
            operands_.push_back(obj);
            return;
        }
        const std::string op = obj.getOperatorValue();
        if (op == "Tj") {
            show_last_string();
        } else if (op == "'" || op == "\"") {
            newline();
            show_last_string();
        } else if (op == "TJ") {
            if (!operands_.empty() && operands_.back().isArray()) {
                for (const auto& item : operands_.back().getArrayAsVector()) {
                    if (item.isString()) {
                        out_ += item.getStringValue();
                    } else if (item.isNumber() && item.getNumericValue() < kWordGap) {
                        space();
                    }
                }
            }
        } else if (op == "T*" || op == "Td" || op == "TD" || op == "ET") {
            newline();
        }
        operands_.clear();
    }

    void handleEOF() override { newline(); }

private:
    void show_last_string() {
        if (!operands_.empty() && operands_.back().isString()) {
            out_ += operands_.back().getStringValue();
        }
    }
    void space() {
        if (!out_.empty() && out_.back() != ' ' && out_.back() != '\n') out_ += ' ';
    }
    void newline() {
        if (!out_.empty() && out_.back() != '\n') out_ += '\n';
    }

    std::string& out_;
    std::vector<QPDFObjectHandle> operands_;
};

void read_info(QPDF& pdf, std::map<std::string, std::string>& metadata) {
    static constexpr std::array<std::pair<const char*, const char*>, 5> keys{{
        {"/Title", "title"}, {"/Author", "author"}, {"/Subject", "subject"},
        {"/Creator", "creator"}, {"/Producer", "producer"}
    }};

    QPDFObjectHandle trailer = pdf.getTrailer();
    if (!trailer.isDictionary() || !trailer.hasKey("/Info")) return;
    QPDFObjectHandle info = trailer.getKey("/Info");
    if (!info.isDictionary()) return;

    for (const auto& [pdf_key, name] : keys) {
        if (!info.hasKey(pdf_key)) continue;
        QPDFObjectHandle value = info.getKey(pdf_key);
        if (value.isString()) {
            metadata[name] = value.getUTF8Value();
        }
    }
}

} // namespace

Outcome<RenderedDocument> QpdfArtifactReader::read(const Bytes& artifact) const {
    LoggerStreamBuf warn_buf(LogLevel::Warning, "qpdf");
    LoggerStreamBuf err_buf(LogLevel::Error, "qpdf");
    std::ostream warn_os(&warn_buf);
    std::ostream err_os(&err_buf);

    try {
        QPDF pdf;
        auto qlogger = QPDFLogger::create();
        qlogger->setOutputStreams(&warn_os, &err_os);
        pdf.setLogger(qlogger);
        pdf.processMemoryFile("rendered.pdf",
                              reinterpret_cast<const char*>(artifact.data()),
                              artifact.size());

        RenderedDocument doc;
        auto pages = QPDFPageDocumentHelper(pdf).getAllPages();
        for (auto& page : pages) {
            std::string page_text;
            TextCollector collector(page_text);
            page.parseContents(&collector);
            while (!page_text.empty() && page_text.back() == '\n') page_text.pop_back();
            if (!doc.text.empty()) doc.text += "\n\n";
            doc.text += page_text;
        }

        read_info(pdf, doc.metadata);
        doc.metadata["pages"] = std::to_string(pages.size());

        Logger::log(LogLevel::Debug, "Read " + std::to_string(pages.size()) + " pages, "
                    + std::to_string(doc.text.size()) + " characters", kTag);
        return doc;
    } catch (const QPDFExc& e) {
        Logger::log(LogLevel::Error, std::string("Malformed PDF: ") + e.what(), kTag);
        return PipelineError::processing(std::string("Failed to read rendered PDF: ") + e.what());
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("PDF read failed: ") + e.what(), kTag);
        return PipelineError::processing(std::string("Failed to read rendered PDF: ") + e.what());
    }
}

std::unique_ptr<IRenderedArtifactReader> make_artifact_reader(const bool read_rendered_artifacts) {
    if (read_rendered_artifacts) {
        return std::make_unique<QpdfArtifactReader>();
    }
    return std::make_unique<NullArtifactReader>();
}

} // namespace texharvest
