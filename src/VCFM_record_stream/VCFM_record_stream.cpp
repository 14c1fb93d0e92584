#include "VCFM_record_stream.h"
#include "vcfm_io.h"
#include <algorithm>
#include <sstream>
#include <utility>

bool MergeRecord::operator>(const MergeRecord &other) const {
    if (chrom != other.chrom)
        return chrom > other.chrom;
    if (pos != other.pos)
        return pos > other.pos;
    return rank > other.rank;
}

bool isUninformativeGenotype(const std::string &gt) {
    return gt == "." || gt == "./." || gt == "0/0" || gt == ".|." || gt == "0|0";
}

bool allSamplesUninformative(const std::vector<std::string> &fields, size_t first) {
    for (size_t i = first; i < fields.size(); ++i) {
        const std::string &sample = fields[i];
        size_t colon = sample.find(':');
        if (!isUninformativeGenotype(colon == std::string::npos ? sample : sample.substr(0, colon)))
            return false;
    }
    return true;
}

RecordStream::RecordStream(vcfm::LineSource &in, size_t headerSamples, std::vector<size_t> projection, size_t rank,
                           bool removeRef, std::string name, std::ostream &diag)
    : in_(in), headerSamples_(headerSamples), projection_(std::move(projection)), rank_(rank), removeRef_(removeRef),
      name_(std::move(name)), diag_(diag) {}

static long parsePosition(const std::string &text) {
    size_t used = 0;
    long pos = 0;
    try {
        pos = std::stol(text, &used);
    } catch (const std::exception &) {
        used = 0;
    }
    if (used == 0 || used != text.size()) {
        throw vcfm::ParseError("invalid POS '" + text + "'");
    }
    return pos;
}

void RecordStream::decodeLine(const std::string &line, MergeRecord &record) {
    const size_t first = static_cast<size_t>(vcfm::VCF::FIRST_SAMPLE);
    // Sites-only files may omit FORMAT; otherwise all declared samples are required
    const size_t minFields = headerSamples_ > 0 ? first + headerSamples_ : static_cast<size_t>(vcfm::VCF::MIN_FIELDS);
    vcfm::split_tabs(line, columns_);
    if (columns_.size() < minFields) {
        std::ostringstream msg;
        msg << name_ << ": data line " << lineNumber_ << " has " << columns_.size() << " columns, expected at least "
            << minFields;
        throw vcfm::ParseError(msg.str());
    }

    size_t fixed = std::min(columns_.size(), first);
    size_t sampleColumns = columns_.size() - fixed;
    record.fields.clear();
    record.fields.reserve(fixed + projection_.size());
    for (size_t i = 0; i < fixed; ++i)
        record.fields.push_back(std::move(columns_[i]));
    for (size_t idx : projection_) {
        if (idx >= sampleColumns) {
            std::ostringstream msg;
            msg << name_ << ": data line " << lineNumber_ << " has " << sampleColumns
                << " sample columns, merged sample index " << idx << " is out of range";
            throw vcfm::ParseError(msg.str());
        }
        record.fields.push_back(columns_[first + idx]);
    }
}

void RecordStream::checkOrder(const MergeRecord &record) {
    if (!unsortedReported_ && record.chrom == lastChrom_ && record.pos < lastPos_) {
        std::ostringstream msg;
        msg << name_ << " is not sorted: " << record.chrom << ':' << record.pos << " follows " << lastChrom_ << ':'
            << lastPos_;
        vcfm::print_warning(msg.str(), diag_);
        unsortedReported_ = true;
    }
    lastChrom_ = record.chrom;
    lastPos_ = record.pos;
}

bool RecordStream::next(MergeRecord &record) {
    if (finished_)
        return false;

    while (in_.getline(line_)) {
        if (line_.empty() || line_[0] == '#')
            continue;
        ++lineNumber_;
        vcfm::rtrim(line_);
        ++total_;

        decodeLine(line_, record);
        if (removeRef_ && allSamplesUninformative(record.fields, vcfm::VCF::FIRST_SAMPLE)) {
            ++skipped_;
            continue;
        }

        // Symbolic ALT with an 'N' placeholder REF
        std::string &ref = record.fields[vcfm::VCF::REF];
        const std::string &alt = record.fields[vcfm::VCF::ALT];
        if (ref == "N" && !alt.empty() && alt[0] == '<')
            ref = ".";

        try {
            record.pos = parsePosition(record.fields[vcfm::VCF::POS]);
        } catch (const vcfm::ParseError &e) {
            std::ostringstream msg;
            msg << name_ << ": data line " << lineNumber_ << ": " << e.what();
            throw vcfm::ParseError(msg.str());
        }
        record.chrom = record.fields[vcfm::VCF::CHROM];
        record.rank = rank_;
        checkOrder(record);
        return true;
    }

    finished_ = true;
    if (removeRef_) {
        diag_ << ">> skipped " << skipped_ << " ref/unknown variants out of " << total_ << " from " << name_ << '\n';
    }
    return false;
}
