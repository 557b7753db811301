DECLARE_MSG_ARG(action, "install the `rust-src` component for the selected toolchain")
DECLARE_MSG_ARG(column, "42")
DECLARE_MSG_ARG(command_line, "rustup component add rust-src")
DECLARE_MSG_ARG(env_var, "RUST_LIB_SRC")
DECLARE_MSG_ARG(error_msg, "File Not Found")
DECLARE_MSG_ARG(exit_code, "127")
DECLARE_MSG_ARG(option, "-Zcareful-frobnicate")
DECLARE_MSG_ARG(path, "/home/user/.cache/cargo-careful")
DECLARE_MSG_ARG(row, "42")
DECLARE_MSG_ARG(sanitizer, "address")
DECLARE_MSG_ARG(system_api, "CreateProcessW")
DECLARE_MSG_ARG(target, "x86_64-unknown-linux-gnu")
DECLARE_MSG_ARG(tool_name, "cargo")
DECLARE_MSG_ARG(value, "")
