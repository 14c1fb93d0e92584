#include "VCFM_output_sink.h"
#include "vcfm_io.h"

static const char *const FILEFORMAT_LINE = "##fileformat=VCFv4.1";
static const char *const FIXED_COLUMNS = "#CHROM\tPOS\tID\tREF\tALT\tQUAL\tFILTER\tINFO\tFORMAT";

VcfWriter::VcfWriter(std::ostream &out) : out_(out) { buffer_.reserve(BUFFER_SIZE); }

VcfWriter::~VcfWriter() { flush(); }

void VcfWriter::flush() {
    if (!buffer_.empty()) {
        out_.write(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        buffer_.clear();
    }
    out_.flush();
}

void VcfWriter::writeLine(const std::string &line) {
    if (buffer_.size() + line.size() + 1 > BUFFER_SIZE)
        flush();
    buffer_.append(line);
    buffer_.push_back('\n');
}

void VcfWriter::writeDefinitions(const DefinitionMap &defs) {
    for (const auto &entry : defs)
        writeLine(entry.second);
}

void VcfWriter::writeHeader(const VcfHeader &header) {
    writeLine(FILEFORMAT_LINE);
    for (const auto &line : header.other)
        writeLine(line);
    writeDefinitions(header.formats);
    writeDefinitions(header.infos);
    writeDefinitions(header.contigs);
    writeDefinitions(header.filters);

    std::string columns = FIXED_COLUMNS;
    for (const auto &sample : header.samples) {
        columns.push_back('\t');
        columns.append(sample);
    }
    writeLine(columns);
}

void VcfWriter::writeRecord(const MergeRecord &record) {
    if (buffer_.size() + 1 > BUFFER_SIZE)
        flush();
    vcfm::join_tabs(record.fields, buffer_);
    buffer_.push_back('\n');
    ++records_;
    if (buffer_.size() >= BUFFER_SIZE)
        flush();
}
