#pragma once

namespace gotfiles::cli
{
    /**
     * Parse the command line and dispatch to init or sync.
     * @return process exit status: 0 on completion (per-item and git failures
     *         are only logged), 1 on usage errors and fatal startup errors
     */
    int run(int argc, char *argv[]);

} // namespace gotfiles::cli
