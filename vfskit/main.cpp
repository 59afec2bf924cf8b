#include "vfs_ops.h"
#include "options.h"
#include <cstddef>
#include <cstdlib>
#include <iostream>

struct cli_options {
    char* config;
};

static const struct fuse_opt cli_spec[] = {
    {"--config=%s", offsetof(struct cli_options, config), 1},
    FUSE_OPT_END
};

int main(int argc, char* argv[]) {
    struct fuse_args args = FUSE_ARGS_INIT(argc, argv);
    struct cli_options cli = {nullptr};
    if (fuse_opt_parse(&args, &cli, cli_spec, nullptr) == -1) return 1;

    // Without a config file an empty in-memory tree is served.
    vfskit::Options opts;
    opts.backend = vfskit::BackendKind::Memory;
    if (cli.config) {
        std::string err;
        int rc = vfskit::load_options(cli.config, opts, err);
        free(cli.config);
        if (rc < 0) {
            std::cerr << "vfskit-mount: " << err << std::endl;
            fuse_opt_free_args(&args);
            return 1;
        }
    }

    std::unique_ptr<vfskit::FsBackend> fs;
    int rc = vfskit::open_backend(opts, fs);
    if (rc < 0) {
        std::cerr << "vfskit-mount: cannot open " << opts.root << ": " << vfskit::error_message(rc) << std::endl;
        fuse_opt_free_args(&args);
        return 1;
    }

    // Entries are unsynchronised shared state.
    if (fuse_opt_add_arg(&args, "-s") == -1) {
        fuse_opt_free_args(&args);
        return 1;
    }
    vfskit::mounted_fs = fs.get();
    int res = fuse_main(args.argc, args.argv, &vfskit::vfs_oper, nullptr);
    vfskit::mounted_fs = nullptr;
    fuse_opt_free_args(&args);
    return res;
}
