#include "../../include/audio_tag_strategy.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <taglib/aifffile.h>
#include <taglib/fileref.h>
#include <taglib/flacfile.h>
#include <taglib/id3v2tag.h>
#include <taglib/mp4file.h>
#include <taglib/mp4tag.h>
#include <taglib/mpegfile.h>
#include <taglib/opusfile.h>
#include <taglib/tpropertymap.h>
#include <taglib/vorbisfile.h>
#include <taglib/wavfile.h>
#include <taglib/xiphcomment.h>
#include <vector>

namespace metawipe {

namespace fs = std::filesystem;

static const char* strategy_tag() {
    return "audio";
}

namespace {

void clear_xiph(TagLib::Ogg::XiphComment* xc) {
    if (!xc) return;
    xc->removeAllFields();
    xc->removeAllPictures();
}

void clear_id3v2(TagLib::ID3v2::Tag* tag) {
    if (!tag) return;
    // copy: removeFrame mutates the list
    const TagLib::ID3v2::FrameList frames = tag->frameList();
    for (auto* frame : frames) {
        tag->removeFrame(frame, true);
    }
}

/**
 * @brief Strips every tag of @p file in place.
 * @return true if TagLib reported the save as successful.
 */
bool strip_tags(TagLib::File* file, Logger& logger) {
    if (auto* mpeg = dynamic_cast<TagLib::MPEG::File*>(file)) {
        logger.debug("MPEG: stripping ID3v1/ID3v2/APE", strategy_tag());
        return mpeg->strip(TagLib::MPEG::File::AllTags);
    }

    if (auto* flac = dynamic_cast<TagLib::FLAC::File*>(file)) {
        logger.debug("FLAC: removing pictures and comments", strategy_tag());
        flac->removePictures();
        clear_xiph(flac->xiphComment(false));
        flac->strip(TagLib::FLAC::File::ID3v1 | TagLib::FLAC::File::ID3v2);
        return flac->save();
    }

    if (auto* vorbis = dynamic_cast<TagLib::Ogg::Vorbis::File*>(file)) {
        logger.debug("Vorbis: clearing Xiph comment", strategy_tag());
        clear_xiph(vorbis->tag());
        return vorbis->save();
    }

    if (auto* opus = dynamic_cast<TagLib::Ogg::Opus::File*>(file)) {
        logger.debug("Opus: clearing Xiph comment", strategy_tag());
        clear_xiph(opus->tag());
        return opus->save();
    }

    if (auto* mp4 = dynamic_cast<TagLib::MP4::File*>(file)) {
        logger.debug("MP4: removing all items", strategy_tag());
        if (auto* tag = mp4->tag()) {
            std::vector<TagLib::String> keys;
            for (const auto& item : tag->itemMap()) {
                keys.push_back(item.first);
            }
            for (const auto& key : keys) {
                tag->removeItem(key);
            }
        }
        return mp4->save();
    }

    if (auto* wav = dynamic_cast<TagLib::RIFF::WAV::File*>(file)) {
        logger.debug("WAV: stripping INFO and ID3", strategy_tag());
        wav->strip();
        return true;
    }

    if (auto* aiff = dynamic_cast<TagLib::RIFF::AIFF::File*>(file)) {
        logger.debug("AIFF: removing ID3 frames", strategy_tag());
        clear_id3v2(aiff->tag());
        return aiff->save();
    }

    logger.debug("Generic container: clearing property map", strategy_tag());
    const TagLib::PropertyMap rejected = file->setProperties(TagLib::PropertyMap());
    if (!rejected.isEmpty()) {
        logger.debug("Some properties could not be removed", strategy_tag());
    }
    return file->save();
}

} // namespace

bool AudioTagStrategy::attempt(const fs::path& path, const CleanOptions& /*options*/) {
    TempFile temp(path, "audio", logger_);

    std::error_code ec;
    fs::copy_file(path, temp.path(), fs::copy_options::overwrite_existing, ec);
    if (ec) {
        logger_.error("Cannot copy " + path.string() + " for tag removal: " + ec.message(), strategy_tag());
        return false;
    }

    bool saved = false;
    try {
        // scope: TagLib must release the file before the rename
#ifdef _WIN32
        TagLib::FileRef ref(temp.path().wstring().c_str());
#else
        TagLib::FileRef ref(temp.path().string().c_str());
#endif
        TagLib::File* file = ref.file();
        if (!file || !file->isValid()) {
            logger_.warning("TagLib cannot open " + path.string(), strategy_tag());
            return false;
        }
        saved = strip_tags(file, logger_);
    } catch (const std::exception& e) {
        logger_.error("TagLib failed for " + path.string() + ": " + e.what(), strategy_tag());
        return false;
    }

    if (!saved) {
        logger_.warning("TagLib could not save " + path.string(), strategy_tag());
        return false;
    }
    return temp.commit();
}

} // namespace metawipe
