DECLARE_MESSAGE(AbortingAsRequested, (), "", "aborting as per your request")
DECLARE_MESSAGE(AskToRun,
                (msg::command_line, msg::action),
                "The trailing space is intentional; the user types the answer on the same line.",
                "I will run `{command_line}` to {action}. Proceed? [Y/n] ")
DECLARE_MESSAGE(BuildOutputContainsDirectory,
                (msg::path),
                "",
                "cargo output directory must not contain directories, but found `{path}`")
DECLARE_MESSAGE(CacheRootUnavailable,
                (msg::env_var),
                "",
                "unable to determine the cache directory: {env_var} is not set")
DECLARE_MESSAGE(CarefulCalledWithBadFirstArgument,
                (),
                "",
                "`cargo-careful` called with bad first argument; please only invoke this binary through `cargo "
                "careful`")
DECLARE_MESSAGE(CarefulCalledWithoutFirstArgument,
                (),
                "",
                "`cargo-careful` called without first argument; please only invoke this binary through `cargo "
                "careful`")
DECLARE_MESSAGE(ChecksFailedCheck, (), "", "cargo-careful has crashed; no additional details are available.")
DECLARE_MESSAGE(ChecksUnreachableCode, (), "", "unreachable code was reached")
DECLARE_MESSAGE(FailedToAction, (msg::action), "", "failed to {action}")
DECLARE_MESSAGE(FailedToCleanSysroot, (msg::path), "", "failed to clean sysroot target directory `{path}`")
DECLARE_MESSAGE(FailedToCopyArtifact, (msg::path), "", "failed to copy cargo output file `{path}`")
DECLARE_MESSAGE(FailedToCreateDirectory, (msg::path), "", "failed to create directory `{path}`")
DECLARE_MESSAGE(FailedToCreateTempDir, (), "", "failed to create a temporary build directory")
DECLARE_MESSAGE(FailedToReadBuildOutput, (msg::path), "", "failed to read cargo output directory `{path}`")
DECLARE_MESSAGE(FailedToWriteCacheMarker, (msg::path), "", "failed to write cache marker `{path}`")
DECLARE_MESSAGE(FailedToWriteFile, (msg::path), "", "failed to write `{path}`")
DECLARE_MESSAGE(InstallRustSrcAction,
                (),
                "Completes the sentence 'I will run ... to '",
                "install the `rust-src` component for the selected toolchain")
DECLARE_MESSAGE(InternalErrorMessageContact,
                (),
                "",
                "Please open an issue at https://github.com/RalfJung/cargo-careful/issues with detailed steps to "
                "reproduce the problem.")
DECLARE_MESSAGE(InvalidAnswer, (msg::value), "", "invalid answer `{value}`")
DECLARE_MESSAGE(JsonControlCharacterInString, (), "", "control character in string")
DECLARE_MESSAGE(JsonDuplicateKey, (msg::value), "", "duplicated key \"{value}\" in an object")
DECLARE_MESSAGE(JsonErrorLocation, (msg::path, msg::row, msg::column), "", "{path}:{row}:{column}: ")
DECLARE_MESSAGE(JsonExpectedStringArray, (), "", "expected an array of strings")
DECLARE_MESSAGE(JsonInvalidEscape, (), "", "invalid escape sequence in string")
DECLARE_MESSAGE(JsonInvalidNumber, (msg::value), "", "invalid number: {value}")
DECLARE_MESSAGE(JsonTrailingCharacters, (), "", "unexpected characters after the top-level value")
DECLARE_MESSAGE(JsonUnexpectedCharacter, (), "", "unexpected character")
DECLARE_MESSAGE(JsonUnexpectedEof, (), "", "unexpected end of input")
DECLARE_MESSAGE(LaunchingProgramFailed,
                (msg::tool_name),
                "A platform API call failure message is appended after this",
                "Launching {tool_name}:")
DECLARE_MESSAGE(LockfileMissing,
                (msg::path),
                "",
                "failed to copy lockfile: `{path}` does not exist; the library source tree is incomplete")
DECLARE_MESSAGE(MissingSubcommand,
                (),
                "",
                "`cargo careful` needs to be called with a subcommand (`run`, `test`, `build`, `nextest`, `setup`)")
DECLARE_MESSAGE(PreparingSysroot,
                (msg::target),
                "The trailing space is intentional; 'done' may follow on the same line.",
                "Preparing a careful sysroot (target: {target})... ")
DECLARE_MESSAGE(PreparingSysrootWithSanitizer,
                (msg::target, msg::sanitizer),
                "The trailing space is intentional; 'done' may follow on the same line.",
                "Preparing a careful sysroot (target: {target}, sanitizer: {sanitizer})... ")
DECLARE_MESSAGE(ProgramReturnedNonzeroExitCode,
                (msg::tool_name, msg::exit_code),
                "The program's console output is appended after this.",
                "{tool_name} failed with exit code: ({exit_code}).")
DECLARE_MESSAGE(RunningToAction, (msg::command_line, msg::action), "", "Running `{command_line}` to {action}.")
DECLARE_MESSAGE(RustSrcMissing,
                (msg::path),
                "",
                "the `rust-src` component is not available; expected the library sources at `{path}`")
DECLARE_MESSAGE(RustSrcNotFound,
                (msg::path),
                "",
                "`{path}` does not look like a Rust library source directory (`std/src/lib.rs` is missing)")
DECLARE_MESSAGE(SanitizerNotSupported,
                (msg::sanitizer, msg::target),
                "",
                "sanitizer `{sanitizer}` not supported by target `{target}`")
DECLARE_MESSAGE(SanitizerQueryFailed, (), "", "failed to get list of supported sanitizers:")
DECLARE_MESSAGE(SanitizerRuntimeMissing,
                (msg::sanitizer, msg::path),
                "",
                "the `{sanitizer}` sanitizer runtime library was not found at `{path}`")
DECLARE_MESSAGE(SysrootAvailable, (msg::path), "", "A sysroot is now available in `{path}`.")
DECLARE_MESSAGE(SysrootBuildDone, (), "Printed after 'Preparing a careful sysroot...' on the same line.", "done")
DECLARE_MESSAGE(SysrootBuildFailed,
                (),
                "",
                "failed to build sysroot; run `cargo careful setup` to see what went wrong")
DECLARE_MESSAGE(SysrootQueryFailed, (), "", "could not determine sysroot source directory:")
DECLARE_MESSAGE(SystemApiErrorMessage,
                (msg::system_api, msg::exit_code, msg::error_msg),
                "",
                "calling {system_api} failed with {exit_code} ({error_msg})")
DECLARE_MESSAGE(TargetLibdirQueryFailed, (), "", "failed to determine the target library directory:")
DECLARE_MESSAGE(TargetSpecSanitizersNotArray,
                (),
                "",
                "Contents of \"supported-sanitizers\" key in target spec JSON are of unexpected type")
DECLARE_MESSAGE(TargetSpecUnexpectedStructure, (), "", "Target spec JSON has unexpected structure")
DECLARE_MESSAGE(ToolchainHostMissing, (), "", "`rustc -vV` did not report a host triple")
DECLARE_MESSAGE(ToolchainVersionQueryFailed, (), "", "failed to determine rustc version:")
DECLARE_MESSAGE(UnsupportedCarefulFlag, (msg::option), "", "unsupported careful flag `{option}`")
DECLARE_MESSAGE(UnsupportedSubcommand,
                (),
                "",
                "`cargo careful` supports the following subcommands: `run`, `test`, `build`, `nextest`, and `setup`.")
DECLARE_MESSAGE(UsingSanitizer, (msg::sanitizer), "", "Using sanitizer `{sanitizer}`.")
DECLARE_MESSAGE(WaitingToTakeFilesystemLock, (msg::path), "", "waiting to take filesystem lock on {path}...")
