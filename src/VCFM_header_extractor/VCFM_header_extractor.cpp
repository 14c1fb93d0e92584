#include "VCFM_header_extractor.h"
#include "vcfm_io.h"
#include <cctype>
#include <unordered_set>

const std::string *DefinitionMap::find(const std::string &id) const {
    auto it = index_.find(id);
    if (it == index_.end())
        return nullptr;
    return &entries_[it->second].second;
}

void DefinitionMap::assign(const std::string &id, const std::string &line) {
    auto it = index_.find(id);
    if (it != index_.end()) {
        entries_[it->second].second = line;
        return;
    }
    index_.emplace(id, entries_.size());
    entries_.emplace_back(id, line);
}

static bool isWordChar(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

bool parseDefinitionId(const std::string &line, std::string &id) {
    static const std::string marker = "=<ID=";

    size_t pos = line.find(marker);
    while (pos != std::string::npos) {
        size_t kwStart = pos;
        while (kwStart > 0 && isWordChar(line[kwStart - 1]))
            --kwStart;

        size_t idStart = pos + marker.size();
        size_t idEnd = line.find_first_of(",>", idStart);
        if (idEnd == std::string::npos)
            idEnd = line.size();

        if (kwStart < pos && idEnd > idStart) {
            id = line.substr(idStart, idEnd - idStart);
            return true;
        }
        pos = line.find(marker, pos + 1);
    }
    return false;
}

// INFO/FORMAT/FILTER/contig lines map to their own tables
static DefinitionMap *definitionMapFor(VcfHeader &header, const std::string &line) {
    if (line.rfind("##INFO", 0) == 0)
        return &header.infos;
    if (line.rfind("##FORMAT", 0) == 0)
        return &header.formats;
    if (line.rfind("##FILTER", 0) == 0)
        return &header.filters;
    if (line.rfind("##contig", 0) == 0)
        return &header.contigs;
    return nullptr;
}

VcfHeader extractHeader(vcfm::LineSource &in) {
    VcfHeader header;
    std::string line;

    // ##fileformat line; the output writes its own
    if (!in.getline(line))
        return header;

    std::string id;
    std::vector<std::string> fields;
    while (in.getline(line)) {
        if (line.empty() || line[0] != '#') {
            in.unget(std::move(line));
            break;
        }

        DefinitionMap *defs = definitionMapFor(header, line);
        if (defs) {
            if (!parseDefinitionId(line, id)) {
                throw vcfm::ParseError("malformed header line: " + line);
            }
            defs->assign(id, line);
        } else if (line.rfind("#CHROM\t", 0) == 0) {
            vcfm::split_tabs(line, fields);
            header.samples.clear();
            std::unordered_set<std::string> seen;
            for (size_t i = vcfm::VCF::FIRST_SAMPLE; i < fields.size(); ++i) {
                if (!seen.insert(fields[i]).second) {
                    throw vcfm::ParseError("duplicate sample name in #CHROM line: " + fields[i]);
                }
                header.samples.push_back(fields[i]);
            }
        } else {
            header.other.push_back(line);
        }
    }
    return header;
}
