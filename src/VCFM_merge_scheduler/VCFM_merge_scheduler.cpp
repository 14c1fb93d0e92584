#include "VCFM_merge_scheduler.h"
#include <algorithm>
#include <string>
#include <utility>

bool MergeScheduler::Pending::operator>(const Pending &other) const {
    if (record > other.record)
        return true;
    if (other.record > record)
        return false;
    return source > other.source;
}

MergeScheduler::MergeScheduler(std::vector<RecordSource *> sources) : sources_(std::move(sources)) {
    heap_.reserve(sources_.size());
}

void MergeScheduler::pull(size_t source) {
    Pending entry;
    entry.source = source;
    if (!sources_[source]->next(entry.record))
        return;
    heap_.push_back(std::move(entry));
    std::push_heap(heap_.begin(), heap_.end(), std::greater<Pending>());
}

void MergeScheduler::seed() {
    for (size_t i = 0; i < sources_.size(); ++i)
        pull(i);
}

MergeScheduler::Pending MergeScheduler::popMin() {
    std::pop_heap(heap_.begin(), heap_.end(), std::greater<Pending>());
    Pending top = std::move(heap_.back());
    heap_.pop_back();
    return top;
}

size_t MergeScheduler::run(const Emit &emit) {
    size_t emitted = 0;
    std::string lastChrom;
    bool started = false;

    heap_.clear();
    seed();

    while (!heap_.empty()) {
        Pending current = popMin();

        if (started && current.record.chrom != lastChrom) {
            // Chromosome boundary: flush, then start over from every source
            emit(current.record);
            ++emitted;
            while (!heap_.empty()) {
                Pending queued = popMin();
                emit(queued.record);
                ++emitted;
            }
            seed();
            if (heap_.empty())
                break;
            current = popMin();
        }

        lastChrom = current.record.chrom;
        started = true;

        pull(current.source);
        emit(current.record);
        ++emitted;
    }
    return emitted;
}
