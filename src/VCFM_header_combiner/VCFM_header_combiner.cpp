#include "VCFM_header_combiner.h"
#include "vcfm_core.h"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>

std::vector<size_t> buildProjection(const std::vector<std::string> &merged, const std::vector<std::string> &source) {
    std::vector<size_t> projection;
    projection.reserve(merged.size());
    for (const auto &name : merged) {
        auto it = std::find(source.begin(), source.end(), name);
        if (it == source.end()) {
            throw std::logic_error("sample '" + name + "' missing from input header");
        }
        projection.push_back(static_cast<size_t>(it - source.begin()));
    }
    return projection;
}

static bool declaresFloat(const std::string &line) { return line.find("=Float") != std::string::npos; }

void mergeDefinitions(DefinitionMap &base, const DefinitionMap &incoming, const std::string &category,
                      std::vector<HeaderConflict> &conflicts, std::ostream &diag) {
    for (const auto &entry : incoming) {
        const std::string &id = entry.first;
        const std::string &line = entry.second;

        const std::string *existing = base.find(id);
        if (!existing) {
            base.assign(id, line);
            continue;
        }
        if (*existing == line)
            continue;

        HeaderConflict conflict;
        conflict.category = category;
        conflict.id = id;
        if (declaresFloat(line) && !declaresFloat(*existing)) {
            conflict.kept = line;
            conflict.discarded = *existing;
            base.assign(id, line);
        } else {
            conflict.kept = *existing;
            conflict.discarded = line;
        }

        vcfm::print_warning("differing headers for " + id, diag);
        diag << "    " << conflict.discarded << " vs (using)" << conflict.kept << '\n';
        conflicts.push_back(std::move(conflict));
    }
}

CombinedHeader combineHeaders(const VcfHeader &a, const VcfHeader &b, std::ostream &diag) {
    CombinedHeader combined;
    VcfHeader &merged = combined.header;

    std::unordered_set<std::string> samplesB(b.samples.begin(), b.samples.end());
    for (const auto &sample : a.samples) {
        if (samplesB.count(sample))
            merged.samples.push_back(sample);
    }
    combined.projectionA = buildProjection(merged.samples, a.samples);
    combined.projectionB = buildProjection(merged.samples, b.samples);

    merged.formats = a.formats;
    mergeDefinitions(merged.formats, b.formats, "formats", combined.conflicts, diag);
    merged.infos = a.infos;
    mergeDefinitions(merged.infos, b.infos, "infos", combined.conflicts, diag);
    merged.contigs = a.contigs;
    mergeDefinitions(merged.contigs, b.contigs, "contigs", combined.conflicts, diag);
    merged.filters = a.filters;
    mergeDefinitions(merged.filters, b.filters, "filters", combined.conflicts, diag);

    merged.other = a.other;
    std::unordered_set<std::string> seen(merged.other.begin(), merged.other.end());
    for (const auto &line : b.other) {
        if (seen.insert(line).second)
            merged.other.push_back(line);
    }
    return combined;
}
