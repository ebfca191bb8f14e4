#include <pkgindex/git.hpp>
#include <pkgindex/log.hpp>

namespace pkgindex {

Result<std::string> repo_name_from_url(const std::string& url) {
    std::string trimmed = url;
    while (!trimmed.empty() && trimmed.back() == '/') trimmed.pop_back();

    auto slash = trimmed.find_last_of("/:");
    std::string base = slash == std::string::npos ? trimmed
                                                  : trimmed.substr(slash + 1);
    auto dot = base.rfind('.');
    if (dot != std::string::npos && dot > 0) base = base.substr(0, dot);

    if (base.empty() || base == "." || base == "..") {
        return IndexError{IndexError::Config,
            "cannot derive a repository name from '" + url + "'",
            "set index.git-url to a repository URL such as https://host/org/repo.git"};
    }
    return Result<std::string>::ok(std::move(base));
}

static std::string join_args(const std::vector<std::string>& args) {
    std::string s;
    for (const auto& a : args) {
        if (!s.empty()) s += ' ';
        s += a;
    }
    return s;
}

Status GitCli::run_git(const std::vector<std::string>& args,
                       const std::string& working_dir,
                       IndexError::Code failure_code) {
    log::debug("(in %s) git %s", working_dir.c_str(), join_args(args).c_str());
    auto r = runner_.run(git_path_, args, working_dir);
    if (r.is_err()) return std::move(r).error();

    auto& cmd = r.value();
    if (cmd.exit_code != 0) {
        std::string err = cmd.stderr_str;
        while (!err.empty() && (err.back() == '\n' || err.back() == '\r')) {
            err.pop_back();
        }
        return IndexError{failure_code,
            "git " + join_args(args) + " failed with exit code " +
            std::to_string(cmd.exit_code) + (err.empty() ? "" : ": " + err)};
    }
    return ok_status();
}

Status GitCli::clone_shallow(const std::string& url, const std::string& name,
                             const std::string& branch,
                             const std::string& parent_dir) {
    return run_git({"clone", url, name, "--depth", "1", "-b", branch},
                   parent_dir, IndexError::Subprocess);
}

Status GitCli::fetch_tags(const std::string& repo_dir) {
    return run_git({"fetch", "--tags", "--depth=1"},
                   repo_dir, IndexError::Subprocess);
}

Status GitCli::verify_tag(const std::string& repo_dir, const std::string& tag) {
    return run_git({"tag", "-v", tag}, repo_dir, IndexError::Signature);
}

Status GitCli::archive(const std::string& repo_dir, const std::string& ref,
                       const std::string& output) {
    return run_git({"archive", "--format=tar", "-o", output, ref},
                   repo_dir, IndexError::Subprocess);
}

} // namespace pkgindex
