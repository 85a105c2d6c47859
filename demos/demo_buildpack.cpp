// demo_buildpack.cpp
//
// A complete buildpack built on cnbkit. Link or copy the binary to
// <buildpack>/bin/detect and <buildpack>/bin/build; the lifecycle then runs
//
//     bin/detect <platform_dir> <build_plan_path>
//     bin/build  <layers_dir> <platform_dir> <buildpack_plan_path>
//
// Detection passes when the app has a `greeting.txt`. The build puts a
// `greet` script in a cached launch layer, reusing the layer as long as the
// greeting is unchanged, and declares it as the default `web` process.

#include <cnbkit/runtime.hpp>
#include <cnbkit/log.hpp>
#include <cnbkit/toml_file.hpp>

#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using namespace cnbkit;

// Layer metadata, stored in <layers>/greeter.toml under [metadata]
struct GreeterMetadata {
    std::string greeting;

    static Result<GreeterMetadata> from_toml(const toml::table& tbl) {
        auto g = tbl["greeting"].value<std::string>();
        if (!g) return CnbError{CnbError::Parse, "greeter metadata is missing 'greeting'"};
        return Result<GreeterMetadata>::ok(GreeterMetadata{*g});
    }

    toml::table to_toml() const {
        return toml::table{{"greeting", greeting}};
    }
};

class GreeterBuildpack : public Buildpack {
public:
    Result<DetectResult> detect(DetectContext& ctx) override {
        if (!fs::exists(ctx.app_dir / "greeting.txt")) {
            return DetectResultBuilder::fail_with_message("no greeting.txt in the app").build();
        }
        auto plan = BuildPlanBuilder{}.provides("greeting").requires_("greeting").build();
        if (plan.is_err()) return std::move(plan).error();
        return DetectResultBuilder::pass().build_plan(std::move(plan).value()).build();
    }

    Result<BuildResult> build(BuildContext& ctx) override {
        auto contents = read_file(ctx.app_dir() / "greeting.txt");
        if (contents.is_err()) return std::move(contents).error();
        std::string greeting = contents.value();
        while (!greeting.empty() && (greeting.back() == '\n' || greeting.back() == '\r')) {
            greeting.pop_back();
        }

        auto layer_name = LayerName::parse("greeter");
        if (layer_name.is_err()) return std::move(layer_name).error();

        auto previous = ctx.layers().retrieve_as<GreeterMetadata>(layer_name.value());
        if (previous.is_err()) return std::move(previous).error();

        LayerTypes types{true, false, true};
        GreeterMetadata metadata{greeting};

        LayerDecision decision = replace_layer(metadata, types,
            [&](const fs::path& dir, LayerOutput& out) -> Status {
                log::info("writing greet script for '%s'", greeting.c_str());
                std::error_code ec;
                fs::create_directories(dir / "bin", ec);
                if (ec) return CnbError{CnbError::IO, "mkdir bin: " + ec.message()};
                CNBKIT_TRY(write_file(dir / "bin" / "greet",
                                      "#!/bin/sh\necho \"" + greeting + "\"\n"));
                fs::permissions(dir / "bin" / "greet", fs::perms::owner_all,
                                fs::perm_options::add, ec);
                if (ec) return CnbError{CnbError::IO, "chmod greet: " + ec.message()};
                out.env.insert(Scope::launch(), ModificationBehavior::Default,
                               "GREETING", greeting);
                return ok_status();
            });

        if (auto present = std::get_if<TypedLayerPresent<GreeterMetadata>>(&previous.value())) {
            if (present->metadata.greeting == greeting) {
                log::info("reusing cached greeter layer");
                decision = KeepLayer{types, std::nullopt};
            }
        } else if (auto invalid = std::get_if<LayerMetadataInvalid>(&previous.value())) {
            // Version 0.x of this buildpack stored the greeting as 'message'
            auto legacy = invalid->raw["message"].value<std::string>();
            if (legacy && *legacy == greeting) {
                log::info("migrating greeter layer metadata");
                decision = update_layer(metadata, types,
                    [&](const fs::path&, LayerOutput& out) -> Status {
                        out.env.insert(Scope::launch(), ModificationBehavior::Default,
                                       "GREETING", greeting);
                        return ok_status();
                    });
            } else {
                log::warn("recreating greeter layer: %s", invalid->reason.c_str());
            }
        }

        auto layer = ctx.layers().finalize(layer_name.value(), std::move(decision));
        if (layer.is_err()) return std::move(layer).error();

        auto web = ProcessType::parse("web");
        if (web.is_err()) return std::move(web).error();
        auto process = ProcessBuilder(web.value(), "greet").default_().build();
        if (process.is_err()) return std::move(process).error();

        auto launch = LaunchBuilder{}.process(std::move(process).value()).build();
        if (launch.is_err()) return std::move(launch).error();

        return BuildResultBuilder{}
            .layer(std::move(layer).value())
            .launch(std::move(launch).value())
            .build();
    }

    void on_error(const CnbError& error) override {
        if (!error.file.empty()) {
            log::error("greeter buildpack failed while reading %s", error.file.c_str());
        }
    }
};

CNBKIT_BUILDPACK_MAIN(GreeterBuildpack)
