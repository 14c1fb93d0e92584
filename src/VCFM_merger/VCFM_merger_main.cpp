#include "VCFM_merger.h"
#include "vcfm_core.h"
#include "vcfm_io.h"

static void show_help() {
    VCFMMerger obj;
    char arg0[] = "VCFM_merger";
    char arg1[] = "--help";
    char *argv2[] = {arg0, arg1, nullptr};
    obj.run(2, argv2);
}

int main(int argc, char *argv[]) {
    vcfm::init_io();
    if (vcfm::handle_common_flags(argc, argv, "VCFM_merger", show_help))
        return 0;
    VCFMMerger merger;
    return merger.run(argc, argv);
}
