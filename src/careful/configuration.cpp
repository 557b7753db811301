#include <careful/base/expected.h>
#include <careful/base/system.h>

#include <careful/configuration.h>
#include <careful/contractual-constants.h>
#include <careful/errors.h>

namespace
{
    using namespace careful;

    void from_env(const std::function<Optional<std::string>(ZStringView)>& get_env,
                  ZStringView var,
                  std::string& dst)
    {
        auto maybe_val = get_env(var);
        if (auto val = maybe_val.get())
        {
            if (!val->empty())
            {
                dst = std::move(*val);
            }
        }
    }

    Optional<Path> compute_cache_root(const std::function<Optional<std::string>(ZStringView)>& get_env)
    {
#if defined(_WIN32)
        auto maybe_local_app_data = get_env(EnvironmentVariableLocalAppData);
        if (auto local_app_data = maybe_local_app_data.get())
        {
            if (!local_app_data->empty())
            {
                return Path(std::move(*local_app_data)) / "ralfj" / DirectoryCacheLinux / "cache";
            }
        }

        return nullopt;
#else
#if !defined(__APPLE__)
        auto maybe_xdg_cache_home = get_env(EnvironmentVariableXdgCacheHome);
        if (auto xdg_cache_home = maybe_xdg_cache_home.get())
        {
            // relative values are ignored, as the XDG base directory specification requires
            Path xdg_path(std::move(*xdg_cache_home));
            if (xdg_path.is_absolute())
            {
                return std::move(xdg_path) / DirectoryCacheLinux;
            }
        }
#endif

        auto maybe_home = get_env(EnvironmentVariableHome);
        if (auto home = maybe_home.get())
        {
            if (!home->empty())
            {
#if defined(__APPLE__)
                return Path(std::move(*home)) / "Library" / "Caches" / DirectoryCacheMacOS;
#else
                return Path(std::move(*home)) / ".cache" / DirectoryCacheLinux;
#endif
            }
        }

        return nullopt;
#endif
    }
}

namespace careful
{
    void CarefulConfiguration::imbue_from_environment()
    {
        imbue_from_environment_impl(&careful::get_environment_variable);
    }

    void CarefulConfiguration::imbue_from_fake_environment(const std::map<std::string, std::string, std::less<>>& env)
    {
        imbue_from_environment_impl([&env](ZStringView var) -> Optional<std::string> {
            auto it = env.find(var);
            if (it == env.end())
            {
                return nullopt;
            }
            else
            {
                return it->second;
            }
        });
    }

    void CarefulConfiguration::imbue_from_environment_impl(std::function<Optional<std::string>(ZStringView)> get_env)
    {
        from_env(get_env, EnvironmentVariableCargo, cargo);
        from_env(get_env, EnvironmentVariableRustc, rustc);
        rust_lib_src = get_env(EnvironmentVariableRustLibSrc);
        cargo_encoded_rustflags = get_env(EnvironmentVariableCargoEncodedRustFlags);
        rustflags = get_env(EnvironmentVariableRustFlags);
        asan_options_set = get_env(EnvironmentVariableAsanOptions).has_value();

        // Azure Pipelines does not set CI, but it does set TF_BUILD
        is_ci = get_env(EnvironmentVariableCI).has_value() || get_env(EnvironmentVariableTfBuild).has_value();

        auto maybe_debug = get_env(EnvironmentVariableCargoCarefulDebug);
        debugging = maybe_debug.has_value() && *maybe_debug.get() == "1";

        cache_root = compute_cache_root(get_env);
    }

    ExpectedC<Path> CarefulConfiguration::cache_directory() const
    {
        if (auto root = cache_root.get())
        {
            return *root;
        }

#if defined(_WIN32)
        return make_error(ErrorKind::ConfigQueryFailed,
                          msgCacheRootUnavailable,
                          msg::env_var = EnvironmentVariableLocalAppData);
#else
        return make_error(
            ErrorKind::ConfigQueryFailed, msgCacheRootUnavailable, msg::env_var = EnvironmentVariableHome);
#endif
    }
}
