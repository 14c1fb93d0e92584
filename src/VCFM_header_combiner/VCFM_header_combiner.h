#ifndef VCFM_HEADER_COMBINER_H
#define VCFM_HEADER_COMBINER_H

#include "../VCFM_header_extractor/VCFM_header_extractor.h"
#include <iostream>
#include <string>
#include <vector>

// One ID defined differently by the two inputs
struct HeaderConflict {
    std::string category; // "formats", "infos", "contigs" or "filters"
    std::string id;
    std::string kept;
    std::string discarded;
};

struct CombinedHeader {
    VcfHeader header;
    // projectionA[i] / projectionB[i]: sample column of header.samples[i] in each input
    std::vector<size_t> projectionA;
    std::vector<size_t> projectionB;
    std::vector<HeaderConflict> conflicts;
};

// Position of every name of 'merged' within 'source'.
// Throws std::logic_error if a name is missing from 'source'.
std::vector<size_t> buildProjection(const std::vector<std::string> &merged, const std::vector<std::string> &source);

// Fold 'incoming' into 'base'. On a differing definition the line declaring
// a Float type wins over one that does not; otherwise 'base' is kept.
// Each conflict is appended to 'conflicts' and reported on 'diag'.
void mergeDefinitions(DefinitionMap &base, const DefinitionMap &incoming, const std::string &category,
                      std::vector<HeaderConflict> &conflicts, std::ostream &diag);

// Merge the headers of two inputs. Samples are those of 'a' also present in
// 'b', in the order of 'a'.
CombinedHeader combineHeaders(const VcfHeader &a, const VcfHeader &b, std::ostream &diag = std::cerr);

#endif // VCFM_HEADER_COMBINER_H
