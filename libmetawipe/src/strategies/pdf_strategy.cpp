#include "../../include/pdf_strategy.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFLogger.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFWriter.hh>
#include <sstream>
#include <string>

namespace {

const char* strategy_tag() {
    return "pdf";
}

// drop the Info dictionary and the XMP metadata stream
void strip_metadata(QPDF& pdf) {
    QPDFObjectHandle trailer = pdf.getTrailer();
    if (trailer.isDictionary()) {
        if (trailer.hasKey("/Info")) trailer.removeKey("/Info");
        if (trailer.hasKey("/Metadata")) trailer.removeKey("/Metadata");
    }
    QPDFObjectHandle root = pdf.getRoot();
    if (root.isDictionary()) {
        if (root.hasKey("/Metadata")) root.removeKey("/Metadata");
        if (root.hasKey("/PieceInfo")) root.removeKey("/PieceInfo");
    }
}

} // namespace

namespace metawipe {

namespace fs = std::filesystem;

bool PdfStrategy::attempt(const fs::path& path, const CleanOptions& /*options*/) {
    TempFile temp(path, "pdf", logger_);

    // qpdf diagnostics are collected and forwarded to our logger
    std::ostringstream warn_os;
    std::ostringstream err_os;

    try {
        QPDF pdf;
        auto qlogger = QPDFLogger::create();
        qlogger->setOutputStreams(&warn_os, &err_os);
        pdf.setLogger(qlogger);
        pdf.processFile(path.string().c_str());

        // a deterministic ID can't be combined with encryption, and dropping
        // the encryption is not ours to decide
        if (pdf.isEncrypted()) {
            logger_.warning("Encrypted PDF left untouched: " + path.string(), strategy_tag());
            return false;
        }

        strip_metadata(pdf);

        QPDFWriter writer(pdf, temp.path().string().c_str());
        writer.setDeterministicID(true);
        writer.write();
    } catch (const std::exception& e) {
        logger_.error("qpdf failed for " + path.string() + ": " + e.what(), strategy_tag());
        if (!err_os.str().empty()) {
            logger_.debug("qpdf: " + err_os.str(), strategy_tag());
        }
        return false;
    }

    if (!warn_os.str().empty()) {
        logger_.debug("qpdf warnings: " + warn_os.str(), strategy_tag());
    }

    if (!temp.commit()) {
        return false;
    }
    logger_.debug("PDF rewritten without document metadata: " + path.string(), strategy_tag());
    return true;
}

} // namespace metawipe
