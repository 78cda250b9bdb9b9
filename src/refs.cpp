#include "gitwire/refs.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/fs.hpp"
#include "gitwire/util.hpp"

#include <algorithm>
#include <map>
#include <sstream>
#include <string>
#include <string_view>

namespace gitwire {

static std::filesystem::path head_file(const std::filesystem::path &git_dir) {
  return git_dir / consts::kHeadFile;
}

static std::filesystem::path ref_path(const std::filesystem::path &git_dir,
                                      const std::string &refname) {
  return git_dir / refname;
}

static std::string read_trimmed(const std::filesystem::path &p) {
  auto bytes = fs::read_file(p);
  std::string s(bytes.begin(), bytes.end());
  strutil::rstrip_newlines(s);
  return s;
}

std::optional<std::string> read_HEAD(const std::filesystem::path &git_dir) {
  const auto head_file_ptr = head_file(git_dir);
  if (!fs::exists(head_file_ptr)) {
    return std::nullopt;
  }
  auto bytes = fs::read_file(head_file_ptr);
  std::string str(bytes.begin(), bytes.end());
  return str;
}

std::optional<std::string> head_symref(const std::filesystem::path &git_dir) {
  auto head = read_HEAD(git_dir);
  if (!head) {
    return std::nullopt;
  }
  strutil::rstrip_newlines(*head);
  if (!std::string_view(*head).starts_with(consts::kRefPrefix)) {
    return std::nullopt;
  }
  return head->substr(consts::kRefPrefix.size());
}

std::vector<PackedRef> read_packed_refs(const std::filesystem::path &git_dir) {
  std::vector<PackedRef> out;
  const auto p = git_dir / consts::kPackedRefs;
  if (!fs::exists(p)) {
    return out;
  }
  const auto bytes = fs::read_file(p);
  std::istringstream iss(std::string(bytes.begin(), bytes.end()));
  std::string line;
  while (std::getline(iss, line)) {
    strutil::rstrip_newlines(line);
    if (line.empty() || line[0] == '#') {
      continue; // header "# pack-refs with: peeled fully-peeled sorted"
    }
    if (line[0] == '^') {
      if (!out.empty() && looks_hex40(std::string_view(line).substr(1))) {
        out.back().peeled = lower_hex(std::string_view(line).substr(1));
      }
      continue;
    }
    const auto sp = line.find(consts::kSpace);
    if (sp == std::string::npos || !looks_hex40(std::string_view(line).substr(0, sp))) {
      continue;
    }
    out.push_back(PackedRef{line.substr(sp + 1), lower_hex(line.substr(0, sp)), std::nullopt});
  }
  return out;
}

std::optional<std::string> read_ref(const std::filesystem::path &git_dir,
                                    const std::string &refname) {
  const auto p = ref_path(git_dir, refname);
  if (fs::exists(p) && std::filesystem::is_regular_file(p)) {
    auto s = read_trimmed(p);
    if (std::string_view(s).starts_with(consts::kRefPrefix)) {
      return read_ref(git_dir, s.substr(consts::kRefPrefix.size()));
    }
    return looks_hex40(s) ? std::optional<std::string>(lower_hex(s)) : std::nullopt;
  }
  for (auto &pr : read_packed_refs(git_dir)) {
    if (pr.name == refname) {
      return pr.sha;
    }
  }
  return std::nullopt;
}

std::vector<RefLine> list_refs(const std::filesystem::path &git_dir) {
  std::map<std::string, RefLine> by_name;
  for (auto &pr : read_packed_refs(git_dir)) {
    by_name[pr.name] = RefLine{pr.sha, pr.name, pr.peeled};
  }

  const auto refs_root = git_dir / consts::kRefsDir;
  if (fs::exists(refs_root)) {
    for (std::filesystem::recursive_directory_iterator it(refs_root), end; it != end; ++it) {
      if (!it->is_regular_file()) {
        continue;
      }
      const std::string name =
          std::string(consts::kRefsDir) + "/" +
          std::filesystem::relative(it->path(), refs_root).generic_string();
      const auto s = read_trimmed(it->path());
      if (!looks_hex40(s)) {
        continue; // symbolic refs below refs/ are not advertised
      }
      by_name[name] = RefLine{lower_hex(s), name, std::nullopt};
    }
  }

  std::vector<RefLine> out;
  auto head = read_HEAD(git_dir);
  if (head) {
    strutil::rstrip_newlines(*head);
    std::optional<std::string> head_sha;
    if (std::string_view(*head).starts_with(consts::kRefPrefix)) {
      head_sha = read_ref(git_dir, head->substr(consts::kRefPrefix.size()));
    } else if (looks_hex40(*head)) {
      head_sha = lower_hex(*head);
    }
    if (head_sha) {
      out.push_back(RefLine{*head_sha, std::string(consts::kHeadFile), std::nullopt});
    }
  }
  for (auto &[name, ref] : by_name) {
    out.push_back(std::move(ref));
  }
  return out;
}

} // namespace gitwire
