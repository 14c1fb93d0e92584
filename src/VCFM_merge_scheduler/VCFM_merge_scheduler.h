#ifndef VCFM_MERGE_SCHEDULER_H
#define VCFM_MERGE_SCHEDULER_H

#include "../VCFM_record_stream/VCFM_record_stream.h"
#include <functional>
#include <vector>

// Streaming merge of record sources sorted by (CHROM, POS).
//
// At most one record per source is held at a time. Records come out in
// (CHROM, POS, rank) order with one exception: when the chromosome changes,
// the record that started the new chromosome and everything still queued are
// written straight away, then every source is asked for its next record and
// normal ordering resumes. This lets inputs whose chromosome order is not
// lexicographic (chr2 before chr10) still be merged, as long as both inputs
// share that order.
class MergeScheduler {
  public:
    using Emit = std::function<void(const MergeRecord &)>;

    // Sources are borrowed and must outlive run()
    explicit MergeScheduler(std::vector<RecordSource *> sources);

    // Drive all sources to exhaustion; returns the number of records emitted
    size_t run(const Emit &emit);

  private:
    struct Pending {
        MergeRecord record;
        size_t source;

        bool operator>(const Pending &other) const;
    };

    // Push the next record of 'source' unless it is exhausted
    void pull(size_t source);
    // Pull once from every source
    void seed();
    Pending popMin();

    std::vector<RecordSource *> sources_;
    std::vector<Pending> heap_;
};

#endif // VCFM_MERGE_SCHEDULER_H
