#pragma once

#include <careful/base/stringview.h>

namespace careful
{
    // Environment variables read or written by cargo-careful
    inline constexpr StringLiteral EnvironmentVariableAsanOptions = "ASAN_OPTIONS";
    inline constexpr StringLiteral EnvironmentVariableCargo = "CARGO";
    inline constexpr StringLiteral EnvironmentVariableCargoCarefulDebug = "CARGO_CAREFUL_DEBUG";
    inline constexpr StringLiteral EnvironmentVariableCargoDefaultLibMetadata = "__CARGO_DEFAULT_LIB_METADATA";
    inline constexpr StringLiteral EnvironmentVariableCargoEncodedRustDocFlags = "CARGO_ENCODED_RUSTDOCFLAGS";
    inline constexpr StringLiteral EnvironmentVariableCargoEncodedRustFlags = "CARGO_ENCODED_RUSTFLAGS";
    inline constexpr StringLiteral EnvironmentVariableCargoTargetDir = "CARGO_TARGET_DIR";
    inline constexpr StringLiteral EnvironmentVariableCI = "CI";
    inline constexpr StringLiteral EnvironmentVariableHome = "HOME";
    inline constexpr StringLiteral EnvironmentVariableLocalAppData = "LOCALAPPDATA";
    inline constexpr StringLiteral EnvironmentVariableRustc = "RUSTC";
    inline constexpr StringLiteral EnvironmentVariableRustDocFlags = "RUSTDOCFLAGS";
    inline constexpr StringLiteral EnvironmentVariableRustFlags = "RUSTFLAGS";
    inline constexpr StringLiteral EnvironmentVariableRustLibSrc = "RUST_LIB_SRC";
    inline constexpr StringLiteral EnvironmentVariableTfBuild = "TF_BUILD";
    inline constexpr StringLiteral EnvironmentVariableXdgCacheHome = "XDG_CACHE_HOME";

    // Files of the sysroot cache and the synthetic build project
    inline constexpr StringLiteral FileCacheLock = ".cargo-careful.lock";
    inline constexpr StringLiteral FileCacheMarker = ".cargo-careful-hash";
    inline constexpr StringLiteral FileCargoLock = "Cargo.lock";
    inline constexpr StringLiteral FileCargoToml = "Cargo.toml";
    inline constexpr StringLiteral FileLibRs = "lib.rs";

    // Directory names
    inline constexpr StringLiteral DirectoryCacheLinux = "cargo-careful";
    inline constexpr StringLiteral DirectoryCacheMacOS = "de.ralfj.cargo-careful";
    inline constexpr StringLiteral DirectoryTempPrefix = "careful-sysroot";

    // Flags passed to every crate compiled against the careful sysroot, and to the sysroot itself.
    inline constexpr StringLiteral CarefulBaselineFlags[] = {
        "-Cdebug-assertions=on",
        "-Zextra-const-ub-checks",
        "-Zstrict-init-checks",
        "--cfg",
        "careful",
    };

    inline constexpr StringLiteral StdFeatures[] = {"panic_unwind", "backtrace"};

    // The sanitizer used when `-Zcareful-sanitizer` is passed without a value.
    inline constexpr StringLiteral DefaultSanitizer = "address";
    inline constexpr StringLiteral AsanOptionsWithoutLeakDetection = "detect_leaks=0";

    inline constexpr StringLiteral CargoLibMetadata = "cargo-careful";
    inline constexpr StringLiteral CarefulFirstArgument = "careful";
    inline constexpr StringLiteral CarefulFlagPrefix = "-Zcareful-";
    inline constexpr StringLiteral CarefulVerbosePrefix = "[cargo-careful] ";
    inline constexpr StringLiteral UnknownCommitSentinel = "<unknown-commit>";

    inline constexpr char EncodedRustFlagsSeparator = '\x1f';

    // Switches understood by the argument splitter
    inline constexpr StringLiteral SwitchConfig = "--config";
    inline constexpr StringLiteral SwitchManifestPath = "--manifest-path";
    inline constexpr StringLiteral SwitchSysroot = "--sysroot";
    inline constexpr StringLiteral SwitchTarget = "--target";
    inline constexpr StringLiteral SwitchVerbose = "-v";
    inline constexpr StringLiteral SwitchZUnstableOptions = "-Zunstable-options";
}
