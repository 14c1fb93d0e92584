#ifndef VCFM_HEADER_EXTRACTOR_H
#define VCFM_HEADER_EXTRACTOR_H

#include "vcfm_core.h"
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Definition lines keyed by their ID, kept in first-insertion order
class DefinitionMap {
  public:
    using Entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    // Returns the stored line for 'id', or nullptr
    const std::string *find(const std::string &id) const;

    // Replaces the line in place if 'id' is present, appends otherwise
    void assign(const std::string &id, const std::string &line);

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const DefinitionMap &other) const { return entries_ == other.entries_; }
    bool operator!=(const DefinitionMap &other) const { return !(*this == other); }

  private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, size_t> index_;
};

struct VcfHeader {
    DefinitionMap infos;
    DefinitionMap formats;
    DefinitionMap filters;
    DefinitionMap contigs;
    std::vector<std::string> other;
    std::vector<std::string> samples;
};

// Extract the ID from a "##KEYWORD=<ID=value,...>" line.
// Returns false if the line does not follow that pattern.
bool parseDefinitionId(const std::string &line, std::string &id);

// Read the metadata block of one VCF. The first line (##fileformat) is
// skipped. Reading stops at the first line not starting with '#', which is
// pushed back onto 'in' for the record reader.
// Throws vcfm::ParseError on a malformed INFO/FORMAT/FILTER/contig line or a
// sample name repeated on the #CHROM line.
VcfHeader extractHeader(vcfm::LineSource &in);

#endif // VCFM_HEADER_EXTRACTOR_H
