#include "sweguard/sandbox/runtime.hpp"

#include "sweguard/common/fs.hpp"

namespace sweguard::sandbox {

std::string clone_script(const CloneRequest &request) {
  const std::string setup_commit = request.environment_setup_commit.empty()
                                       ? request.base_commit
                                       : request.environment_setup_commit;
  return "set -e\n"
         "git clone --quiet " +
         common::shell_quote(request.repo_url) +
         " .\n"
         "git checkout --quiet " +
         common::shell_quote(setup_commit) + "\n";
}

std::string prune_history_script(const std::string &base_commit) {
  return "set -e\n"
         "git checkout --quiet --force --detach " +
         common::shell_quote(base_commit) +
         "\n"
         "git for-each-ref --format='%(refname)' | while read -r ref; do git update-ref -d "
         "\"$ref\"; done\n"
         "for remote in $(git remote); do git remote remove \"$remote\"; done\n"
         "git reflog expire --expire=now --all\n"
         "git gc --quiet --prune=now\n";
}

std::string read_only_script(const std::filesystem::path &root, const bool read_only,
                             const std::string &owner) {
  const std::string quoted = common::shell_quote(root.string());
  std::string script;
  if (!owner.empty()) {
    script = "chown -R " + (read_only ? std::string("root:root") : common::shell_quote(owner)) +
             " " + quoted + " && ";
  }
  if (read_only) {
    return script + "chmod -R a-w " + quoted + " && chmod -R a+rX " + quoted;
  }
  return script + "chmod -R u+w " + quoted;
}

std::string render_repo_url(const std::string &url_template, const std::string &repo) {
  std::string url = url_template;
  const std::string placeholder = "{repo}";
  std::size_t pos = 0;
  while ((pos = url.find(placeholder, pos)) != std::string::npos) {
    url.replace(pos, placeholder.size(), repo);
    pos += repo.size();
  }
  return url;
}

bool is_timeout_exit(const int exit_code) { return exit_code == 124 || exit_code == 137; }

} // namespace sweguard::sandbox
