#include "release/artifact_tree.hpp"

#include "io/file_util.hpp"
#include "util/logger.hpp"

#include <filesystem>

namespace relup {

namespace {

std::string InstallDir(const ArtifactTreeInputs& in) {
    return in.install_dir.empty() ? "/opt/" + in.binary_name : in.install_dir;
}

std::string ConfigDir(const ArtifactTreeInputs& in) {
    return in.config_dir.empty() ? "/etc/" + in.binary_name : in.config_dir;
}

} // namespace

std::string RenderDefaultConfig(const ArtifactTreeInputs& in) {
    const auto& id = in.identity;
    std::string s;
    s += "# " + in.product_name + " default configuration\n";
    s += "# version " + id.FullVersion() + "\n\n";
    s += "[release]\n";
    s += "version = \"" + id.semantic_version + "\"\n";
    s += "revision = \"" + id.source_revision + "\"\n";
    s += "platform = \"" + id.target_platform + "\"\n\n";
    s += "[paths]\n";
    s += "install_dir = \"" + InstallDir(in) + "\"\n";
    s += "config_dir = \"" + ConfigDir(in) + "\"\n";
    return s;
}

std::string RenderInstallScript(const ArtifactTreeInputs& in) {
    const std::string bin = in.binary_name;
    std::string s;
    s += "#!/bin/sh\n";
    s += "# Installs " + in.product_name + " " + in.identity.FullVersion() + "\n";
    s += "set -e\n\n";
    s += "INSTALL_DIR=\"" + InstallDir(in) + "\"\n";
    s += "CONFIG_DIR=\"" + ConfigDir(in) + "\"\n";
    s += "BIN_DIR=\"/usr/local/bin\"\n";
    s += "HERE=\"$(cd \"$(dirname \"$0\")/..\" && pwd)\"\n\n";
    s += "mkdir -p \"$INSTALL_DIR\" \"$CONFIG_DIR\"\n";
    s += "cp \"$HERE/bin/" + bin + "\" \"$INSTALL_DIR/" + bin + ".new\"\n";
    s += "chmod 755 \"$INSTALL_DIR/" + bin + ".new\"\n";
    s += "mv -f \"$INSTALL_DIR/" + bin + ".new\" \"$INSTALL_DIR/" + bin + "\"\n";
    s += "ln -sf \"$INSTALL_DIR/" + bin + "\" \"$BIN_DIR/" + bin + "\"\n";
    s += "if [ ! -f \"$CONFIG_DIR/config.toml\" ]; then\n";
    s += "    cp \"$HERE/config/default.toml\" \"$CONFIG_DIR/config.toml\"\n";
    s += "    chmod 644 \"$CONFIG_DIR/config.toml\"\n";
    s += "fi\n\n";
    s += "echo \"" + in.product_name + " " + in.identity.semantic_version + " installed to $INSTALL_DIR\"\n";
    return s;
}

std::string RenderUninstallScript(const ArtifactTreeInputs& in) {
    const std::string bin = in.binary_name;
    std::string s;
    s += "#!/bin/sh\n";
    s += "# Removes " + in.product_name + " " + in.identity.FullVersion() + "\n";
    s += "set -e\n\n";
    s += "INSTALL_DIR=\"" + InstallDir(in) + "\"\n";
    s += "BIN_DIR=\"/usr/local/bin\"\n\n";
    s += "rm -f \"$BIN_DIR/" + bin + "\"\n";
    s += "rm -f \"$INSTALL_DIR/" + bin + "\"\n";
    s += "rmdir \"$INSTALL_DIR\" 2>/dev/null || true\n\n";
    s += "# Configuration in " + ConfigDir(in) + " is kept.\n";
    s += "echo \"" + in.product_name + " uninstalled\"\n";
    return s;
}

std::string RenderReadme(const ArtifactTreeInputs& in) {
    const auto& id = in.identity;
    std::string s;
    s += in.product_name + " " + id.FullVersion() + "\n";
    s += std::string(in.product_name.size() + 1 + id.FullVersion().size(), '=') + "\n\n";
    s += "Installation\n";
    s += "  sudo ./scripts/install\n\n";
    s += "Configuration\n";
    s += "  " + ConfigDir(in) + "/config.toml (created from config/default.toml)\n\n";
    s += "Removal\n";
    s += "  sudo ./scripts/uninstall\n\n";
    s += "Version information\n";
    s += "  Version:         " + id.semantic_version + "\n";
    s += "  Revision:        " + id.source_revision + "\n";
    s += "  Build date:      " + id.build_date + "\n";
    s += "  Target platform: " + id.target_platform + "\n";
    return s;
}

Result AssembleArtifactTree(const ArtifactTreeInputs& in, const std::string& tree_dir) {
    namespace fs = std::filesystem;

    if (in.binary_name.empty()) return Result::Fail(ErrorKind::Config, "binary_name is empty");

    std::error_code ec;
    if (fs::exists(tree_dir, ec)) {
        return Result::Fail(ErrorKind::Io, "artifact tree already exists: " + tree_dir);
    }
    for (const char* sub : kArtifactTreeDirs) {
        if (!fs::create_directories(fs::path(tree_dir) / sub, ec) && ec) {
            return Result::Fail(ec.value(), "mkdir " + tree_dir + "/" + sub + ": " + ec.message());
        }
    }

    const std::string bin_path = tree_dir + "/bin/" + in.binary_name;
    if (auto r = CopyFileContents(in.built_binary, bin_path, /*exclusive=*/true, 0755); !r.ok) {
        return Result::Fail(ErrorKind::BuildFailure, "cannot copy built binary: " + r.msg);
    }

    struct TextFile {
        const char* rel;
        std::string body;
        mode_t mode;
    };
    const TextFile files[] = {
        {"config/default.toml", RenderDefaultConfig(in), 0644},
        {"scripts/install", RenderInstallScript(in), 0755},
        {"scripts/uninstall", RenderUninstallScript(in), 0755},
        {"docs/README", RenderReadme(in), 0644},
    };
    for (const auto& f : files) {
        if (auto r = WriteFileAtomic(tree_dir + "/" + f.rel, f.body, f.mode); !r.ok) return r;
    }

    LogInfo("artifact tree ready: %s", tree_dir.c_str());
    return Result::Ok();
}

} // namespace relup
