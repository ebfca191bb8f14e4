#pragma once

#include <pkgindex/process.hpp>
#include <pkgindex/result.hpp>
#include <string>

namespace pkgindex {

// Local clone directory name for a remote: the URL's base name without
// its extension ("https://host/org/all-cabal-hashes.git" -> "all-cabal-hashes").
// Trailing slashes are ignored.
Result<std::string> repo_name_from_url(const std::string& url);

// Thin wrapper over the git commands used to maintain the index clone.
// Every non-zero exit becomes a Subprocess error carrying git's stderr.
class GitCli {
public:
    GitCli(CommandRunner& runner, std::string git_path)
        : runner_(runner), git_path_(std::move(git_path)) {}

    // `git clone <url> <name> --depth 1 -b <branch>`, run inside parent_dir
    Status clone_shallow(const std::string& url, const std::string& name,
                         const std::string& branch,
                         const std::string& parent_dir);

    // `git fetch --tags --depth=1`
    Status fetch_tags(const std::string& repo_dir);

    // `git tag -v <tag>`; failure is a Signature error
    Status verify_tag(const std::string& repo_dir, const std::string& tag);

    // `git archive --format=tar -o <output> <ref>`
    Status archive(const std::string& repo_dir, const std::string& ref,
                   const std::string& output);

    const std::string& git_path() const { return git_path_; }

private:
    Status run_git(const std::vector<std::string>& args,
                   const std::string& working_dir,
                   IndexError::Code failure_code);

    CommandRunner& runner_;
    std::string git_path_;
};

} // namespace pkgindex
