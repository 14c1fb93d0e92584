#include "VCFM_merger.h"
#include "../VCFM_header_combiner/VCFM_header_combiner.h"
#include "../VCFM_header_extractor/VCFM_header_extractor.h"
#include "../VCFM_merge_scheduler/VCFM_merge_scheduler.h"
#include "../VCFM_output_sink/VCFM_output_sink.h"
#include "../VCFM_record_stream/VCFM_record_stream.h"
#include "vcfm_core.h"
#include <getopt.h>
#include <iostream>
#include <memory>
#include <stdexcept>

bool VCFMMerger::parseArguments(int argc, char *argv[], MergeOptions &opts, bool &showHelp) {
    static struct option long_options[] = {{"remove-ref", no_argument, 0, 'r'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    showHelp = false;
    optind = 1;
    int opt;
    while ((opt = getopt_long(argc, argv, "rh", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'r':
            opts.removeRef = true;
            break;
        case 'h':
            showHelp = true;
            break;
        default:
            return false;
        }
    }
    if (showHelp)
        return true;

    if (argc - optind != 2) {
        vcfm::print_error("expected exactly two input VCF files");
        return false;
    }
    opts.pathA = argv[optind];
    opts.pathB = argv[optind + 1];
    if (opts.pathA == "-" && opts.pathB == "-") {
        vcfm::print_error("only one input may be read from standard input");
        return false;
    }
    return true;
}

int VCFMMerger::run(int argc, char *argv[]) {
    MergeOptions opts;
    bool showHelp = false;
    if (!parseArguments(argc, argv, opts, showHelp)) {
        std::cerr << "Run 'VCFM_merger --help' for usage.\n";
        return 1;
    }
    if (showHelp) {
        displayHelp();
        return 0;
    }

    try {
        mergeFiles(opts, std::cout, std::cerr);
    } catch (const std::exception &e) {
        vcfm::print_error(e.what());
        return 1;
    }
    return 0;
}

void VCFMMerger::displayHelp() {
    std::cout << "VCFM_merger: Merge two sorted VCF files over their shared samples.\n\n"
              << "Usage:\n"
              << "  VCFM_merger [options] <vcf_a> <vcf_b> > merged.vcf\n\n"
              << "Options:\n"
              << "  -r, --remove-ref   Remove variants where all shared samples are either\n"
              << "                     hom-ref or unknown\n"
              << "  -h, --help         Display this help message and exit\n"
              << "  -v, --version      Show program version and exit\n\n"
              << "Description:\n"
              << "  Both inputs may be gzip/BGZF compressed; '-' reads one of them from\n"
              << "  standard input. Output keeps the samples of <vcf_a> that also appear\n"
              << "  in <vcf_b>, in the order of <vcf_a>. INFO/FORMAT/FILTER/contig\n"
              << "  definitions are combined; when the two files define an ID differently\n"
              << "  the Float-typed definition wins, otherwise <vcf_a>'s is kept.\n\n"
              << "  Records are merged by streaming, holding one line per input. Inputs\n"
              << "  must be sorted with the same chromosome order; sort the smaller file\n"
              << "  to match the larger one if needed.\n\n"
              << "Examples:\n"
              << "  VCFM_merger svs.vcf.gz gatk.vcf.gz > merged.vcf\n"
              << "  VCFM_merger --remove-ref svs.vcf small.vcf > merged.vcf\n";
}

MergeSummary VCFMMerger::mergeSources(vcfm::LineSource &a, vcfm::LineSource &b, const std::string &nameA,
                                      const std::string &nameB, bool removeRef, std::ostream &out,
                                      std::ostream &diag) {
    VcfHeader headerA = extractHeader(a);
    VcfHeader headerB = extractHeader(b);
    CombinedHeader combined = combineHeaders(headerA, headerB, diag);

    VcfWriter writer(out);
    writer.writeHeader(combined.header);

    RecordStream streamA(a, headerA.samples.size(), combined.projectionA, 0, removeRef, nameA, diag);
    RecordStream streamB(b, headerB.samples.size(), combined.projectionB, 1, removeRef, nameB, diag);

    MergeScheduler scheduler({&streamA, &streamB});
    scheduler.run([&writer](const MergeRecord &record) { writer.writeRecord(record); });
    writer.flush();

    MergeSummary summary;
    summary.records = writer.recordsWritten();
    summary.conflicts = combined.conflicts.size();
    summary.totalA = streamA.total();
    summary.totalB = streamB.total();
    summary.skippedA = streamA.skipped();
    summary.skippedB = streamB.skipped();
    return summary;
}

MergeSummary VCFMMerger::mergeFiles(const MergeOptions &opts, std::ostream &out, std::ostream &diag) {
    std::unique_ptr<vcfm::LineSource> a = vcfm::open_line_source(opts.pathA);
    std::unique_ptr<vcfm::LineSource> b = vcfm::open_line_source(opts.pathB);
    return mergeSources(*a, *b, opts.pathA, opts.pathB, opts.removeRef, out, diag);
}
