#include "sweguard/validator/test_command.hpp"

#include "sweguard/common/fs.hpp"
#include "sweguard/task/task.hpp"

#include <regex>
#include <unordered_set>

namespace sweguard::validator {

namespace {

const std::regex &unittest_id_regex() {
  static const std::regex pattern(R"(^(\w+)\s+\(([^)]+)\))");
  return pattern;
}

bool is_simple_test_name(const std::string &test_id) {
  static const std::regex pattern(R"(^test_\w+$)");
  return std::regex_match(test_id, pattern);
}

std::vector<std::string> pytest_args(std::vector<std::string> flags, const std::string &node) {
  std::vector<std::string> args = {"python", "-m", "pytest"};
  args.insert(args.end(), flags.begin(), flags.end());
  args.push_back(node);
  return args;
}

} // namespace

std::string unittest_to_django(const std::string &test_id) {
  std::smatch match;
  if (std::regex_search(test_id, match, unittest_id_regex())) {
    return match[2].str() + "." + match[1].str();
  }
  return test_id;
}

std::string unittest_to_pytest(const std::string &test_id) {
  std::smatch match;
  if (!std::regex_search(test_id, match, unittest_id_regex())) {
    return test_id;
  }
  const std::string method = match[1].str();
  const std::string path = match[2].str();
  const auto dot = path.rfind('.');
  if (dot == std::string::npos) {
    return test_id;
  }
  std::string file = path.substr(0, dot);
  for (char &ch : file) {
    if (ch == '.') {
      ch = '/';
    }
  }
  return file + ".py::" + path.substr(dot + 1) + "::" + method;
}

std::vector<std::string> test_command_args(const std::string &repo, const std::string &version,
                                           const std::string &test_id) {
  if (repo == "django/django") {
    const std::string django_id = unittest_to_django(test_id);
    if (task::version_number(version) == 1.9) {
      return {"python", "tests/runtests.py", django_id, "-v", "2"};
    }
    return {"python", "tests/runtests.py", "--settings=test_sqlite", "--parallel", "1",
            django_id, "-v", "2"};
  }
  if (repo == "sympy/sympy") {
    return {"bin/test", "-C", "--verbose", test_id};
  }
  if (repo == "sphinx-doc/sphinx") {
    return {"tox", "--current-env", "-epy39", "-v", "--", unittest_to_pytest(test_id)};
  }
  if (repo == "astropy/astropy") {
    return pytest_args({"-rA", "-vv", "-o", "console_output_style=classic", "--tb=short"},
                       unittest_to_pytest(test_id));
  }

  static const std::unordered_set<std::string> pytest_family = {
      "matplotlib/matplotlib", "scikit-learn/scikit-learn", "pallets/flask",
      "pydata/xarray",         "pytest-dev/pytest",         "psf/requests",
      "pylint-dev/pylint"};
  if (pytest_family.contains(repo)) {
    return pytest_args({"-rA", "-xvs", "--tb=short"}, unittest_to_pytest(test_id));
  }
  if (repo == "mwaskom/seaborn") {
    return pytest_args({"--no-header", "-rA", "-xvs", "--tb=short"}, unittest_to_pytest(test_id));
  }

  if (is_simple_test_name(test_id)) {
    return {"python", "-m", "pytest", "-k", test_id, "-xvs", "--tb=short"};
  }
  return {"python", "-m", "pytest", unittest_to_pytest(test_id), "-xvs", "--tb=short"};
}

std::string build_test_command(const std::string &repo, const std::string &version,
                               const std::string &test_id) {
  std::string command;
  if (repo == "sympy/sympy") {
    command = "PYTHONWARNINGS=" +
              common::shell_quote("ignore::UserWarning,ignore::SyntaxWarning") + " ";
  }
  const auto args = test_command_args(repo, version, test_id);
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      command.push_back(' ');
    }
    command += common::shell_quote(args[i]);
  }
  return command;
}

} // namespace sweguard::validator
