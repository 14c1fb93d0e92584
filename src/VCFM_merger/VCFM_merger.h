#ifndef VCFM_MERGER_H
#define VCFM_MERGER_H

#include "vcfm_core.h"
#include <iostream>
#include <string>

struct MergeOptions {
    std::string pathA;
    std::string pathB;
    // Drop records where every shared sample is hom-ref or missing
    bool removeRef = false;
};

struct MergeSummary {
    size_t records = 0;
    size_t conflicts = 0;
    size_t totalA = 0;
    size_t totalB = 0;
    size_t skippedA = 0;
    size_t skippedB = 0;
};

// VCFM_merger: merge two sorted VCFs over the samples they share
class VCFMMerger {
  public:
    // Entry point for the tool
    int run(int argc, char *argv[]);

    // Parse command-line arguments into 'opts'. Returns false (after printing
    // the reason) on a usage error; 'showHelp' is set for -h/--help.
    bool parseArguments(int argc, char *argv[], MergeOptions &opts, bool &showHelp);

    // Merge two inputs positioned at their first line. The merged header
    // and records go to 'out', warnings and counts to 'diag'.
    static MergeSummary mergeSources(vcfm::LineSource &a, vcfm::LineSource &b, const std::string &nameA,
                                     const std::string &nameB, bool removeRef, std::ostream &out,
                                     std::ostream &diag = std::cerr);

    // Open both paths and merge them
    static MergeSummary mergeFiles(const MergeOptions &opts, std::ostream &out, std::ostream &diag = std::cerr);

  private:
    // Displays the help message
    void displayHelp();
};

#endif // VCFM_MERGER_H
