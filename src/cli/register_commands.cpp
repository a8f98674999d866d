#include "cli/registry.hpp"

int cmd_upload(const gitferry::cli::Options &opts);
int cmd_progress(const gitferry::cli::Options &opts);
int cmd_plan(const gitferry::cli::Options &opts);
int cmd_serve(const gitferry::cli::Options &opts);

namespace gitferry::cli {

CommandTable command_table() {
  CommandTable table;
  table.add(Command{.name = "upload",
                    .args = "<agent> <bundle> <patch>",
                    .summary = "Upload bundle + patch for an agent, resuming where the remote left off",
                    .min_args = 3,
                    .max_args = 3,
                    .value_flags = {"--incremental", "--remote-url", "--remote", "--chunk-size"},
                    .switch_flags = {"--keep"},
                    .fn = ::cmd_upload});
  table.add(Command{.name = "progress",
                    .args = "<agent>",
                    .summary = "Show how many chunks the remote holds for an agent",
                    .min_args = 1,
                    .max_args = 1,
                    .value_flags = {"--remote"},
                    .switch_flags = {},
                    .fn = ::cmd_progress});
  table.add(Command{.name = "plan",
                    .args = "<bundle> <patch>",
                    .summary = "Show envelope and chunk sizes without uploading",
                    .min_args = 2,
                    .max_args = 2,
                    .value_flags = {"--chunk-size", "--incremental", "--remote-url"},
                    .switch_flags = {},
                    .fn = ::cmd_plan});
  table.add(Command{.name = "serve",
                    .args = "[port]",
                    .summary = "Receive uploads over TCP into the store directory",
                    .min_args = 0,
                    .max_args = 1,
                    .value_flags = {"--store"},
                    .switch_flags = {},
                    .fn = ::cmd_serve});
  return table;
}

} // namespace gitferry::cli
