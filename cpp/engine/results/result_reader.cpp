#include "engine/results/result_reader.hpp"

#include <hdf5.h>

#include <algorithm>
#include <cstring>
#include <exception>
#include <functional>
#include <mutex>
#include <string_view>
#include <utility>

#include "engine/core/errors.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/strings.hpp"
#include "engine/results/h5_handle.hpp"
#include "engine/results/path_glob.hpp"

namespace rascheck::results {
namespace {

constexpr std::string_view kSignature{"\x89HDF\r\n\x1a\n", 8};
constexpr int kMaxDepth = 64;

// Fixed-length bytes -> text: cut at NUL, drop trailing pad, apply charset.
std::string decode(const char* p, std::size_t n, H5T_cset_t cset) {
  std::size_t len = 0;
  while (len < n && p[len] != '\0') ++len;
  while (len > 0 && p[len - 1] == ' ') --len;
  std::string s(p, len);
  if (cset != H5T_CSET_UTF8) {
    for (char& c : s) {
      if (static_cast<unsigned char>(c) > 0x7F) c = '?';
    }
  }
  return s;
}

std::string decode_c(const char* p, H5T_cset_t cset) {
  return p ? decode(p, std::strlen(p), cset) : std::string();
}

bool is_numeric_class(H5T_class_t c) noexcept {
  return c == H5T_INTEGER || c == H5T_FLOAT;
}

herr_t collect_link(hid_t, const char* name, const H5L_info_t* info, void* data) {
  auto* names = static_cast<std::vector<std::string>*>(data);
  try {
    if (info->type == H5L_TYPE_HARD) names->emplace_back(name);
  } catch (const std::exception&) {
    return -1;
  }
  return 0;
}

struct AttrVisit {
  std::function<void(hid_t, const char*)> on_attr;
  std::string error;
};

herr_t collect_attr(hid_t loc, const char* name, const H5A_info_t*, void* data) {
  auto* v = static_cast<AttrVisit*>(data);
  try {
    v->on_attr(loc, name);
  } catch (const std::exception& e) {
    v->error = e.what();
    return -1;
  }
  return 0;
}

class Reader {
 public:
  Reader(std::string path, ParsedResultFile* out) : path_(std::move(path)), out_(out) {}

  void open() {
    hdf5_quiet();
    file_ = h5_file(H5Fopen(path_.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT));
    if (!file_) throw ResultReadError(path_, "cannot open HDF5 container");
  }

  // Root markers "File Type" / "File Version".
  void validate_schema() {
    H5Handle root = h5_group(H5Gopen2(file_.get(), "/", H5P_DEFAULT));
    if (!root) throw ResultReadError(path_, "cannot open root group");
    const auto attrs = attributes(root.get(), "/");

    const auto type = attrs.find("File Type");
    const auto version = attrs.find("File Version");
    if (type == attrs.end() || !std::holds_alternative<std::string>(type->second)) {
      throw ResultReadError(path_, "root attribute 'File Type' missing");
    }
    if (version == attrs.end() || !std::holds_alternative<std::string>(version->second)) {
      throw ResultReadError(path_, "root attribute 'File Version' missing");
    }
    out_->file_type = std::get<std::string>(type->second);
    out_->file_version = std::get<std::string>(version->second);
    if (out_->file_type.rfind(kResultFileTypePrefix, 0) != 0) {
      throw ResultReadError(path_, "unexpected 'File Type' '" + out_->file_type + "'");
    }
  }

  void read(const std::vector<std::string>& globs) {
    std::vector<std::pair<std::string, bool>> nodes;  // path, is_group
    H5Handle root = h5_group(H5Gopen2(file_.get(), "/", H5P_DEFAULT));
    if (!root) throw ResultReadError(path_, "cannot open root group");
    walk(root.get(), "", 0, &nodes);
    std::sort(nodes.begin(), nodes.end());

    std::vector<bool> hit(globs.size(), false);
    for (const auto& [p, group] : nodes) {
      bool match = false;
      for (std::size_t g = 0; g < globs.size(); ++g) {
        if (glob_match(globs[g], p)) {
          hit[g] = true;
          match = true;
        }
      }
      if (!match) continue;
      if (group) {
        read_group(p);
      } else {
        read_dataset(p);
      }
    }
    for (std::size_t g = 0; g < globs.size(); ++g) {
      if (!hit[g]) log_debug(path_ + ": no objects under '" + globs[g] + "'");
    }
  }

 private:
  void walk(hid_t group, const std::string& prefix, int depth,
            std::vector<std::pair<std::string, bool>>* nodes) {
    if (depth > kMaxDepth) {
      out_->warnings.push_back(path_ + ": group nesting deeper than " + std::to_string(kMaxDepth) +
                               " at '" + prefix + "'; not descended");
      return;
    }
    std::vector<std::string> names;
    if (H5Literate(group, H5_INDEX_NAME, H5_ITER_INC, nullptr, &collect_link, &names) < 0) {
      throw ResultReadError(path_, "cannot list group '" + (prefix.empty() ? "/" : prefix) + "'");
    }
    for (const auto& name : names) {
      const std::string child = prefix.empty() ? name : prefix + "/" + name;
      H5Handle obj = h5_object(H5Oopen(group, name.c_str(), H5P_DEFAULT));
      if (!obj) {
        out_->warnings.push_back(path_ + ": cannot open '" + child + "'; skipped");
        continue;
      }
      const H5I_type_t t = H5Iget_type(obj.get());
      if (t == H5I_GROUP) {
        nodes->emplace_back(child, true);
        walk(obj.get(), child, depth + 1, nodes);
      } else if (t == H5I_DATASET) {
        nodes->emplace_back(child, false);
      }
    }
  }

  std::map<std::string, AttrValue> attributes(hid_t obj, const std::string& owner) {
    std::map<std::string, AttrValue> out;
    AttrVisit visit;
    visit.on_attr = [&](hid_t loc, const char* name) { read_attribute(loc, name, owner, &out); };
    if (H5Aiterate2(obj, H5_INDEX_NAME, H5_ITER_INC, nullptr, &collect_attr, &visit) < 0) {
      throw ResultReadError(path_, "cannot read attributes of '" + owner + "'" +
                                       (visit.error.empty() ? "" : ": " + visit.error));
    }
    return out;
  }

  void read_attribute(hid_t loc, const char* name, const std::string& owner,
                      std::map<std::string, AttrValue>* out) {
    H5Handle attr = h5_attr(H5Aopen(loc, name, H5P_DEFAULT));
    if (!attr) throw ResultReadError(path_, std::string("cannot open attribute '") + name + "'");
    H5Handle type = h5_type(H5Aget_type(attr.get()));
    H5Handle space = h5_space(H5Aget_space(attr.get()));
    const hssize_t np = H5Sget_simple_extent_npoints(space.get());
    const std::size_t n = np > 0 ? static_cast<std::size_t>(np) : 0;
    const H5T_class_t cls = H5Tget_class(type.get());

    if (is_numeric_class(cls)) {
      std::vector<double> v(n);
      if (n > 0 && H5Aread(attr.get(), H5T_NATIVE_DOUBLE, v.data()) < 0) {
        throw ResultReadError(path_, std::string("cannot read attribute '") + name + "'");
      }
      if (n == 1) {
        (*out)[name] = v.front();
      } else {
        std::vector<std::string> parts;
        for (double d : v) parts.push_back(format_number(d));
        (*out)[name] = join(parts, ",");
      }
      return;
    }
    if (cls == H5T_STRING) {
      const auto s = read_strings(attr.get(), true, type.get(), space.get(), n, name);
      (*out)[name] = n == 1 ? s.front() : join(s, ",");
      return;
    }
    out_->warnings.push_back(path_ + ": attribute '" + owner + "@" + name +
                             "' has an unsupported datatype; skipped");
  }

  // Reads n strings from a dataset or attribute with file type `ftype`.
  std::vector<std::string> read_strings(hid_t obj, bool is_attr, hid_t ftype, hid_t space,
                                        std::size_t n, const std::string& what) {
    std::vector<std::string> out;
    if (n == 0) return out;
    const H5T_cset_t cset = H5Tget_cset(ftype);
    H5Handle mem = h5_type(H5Tcopy(H5T_C_S1));
    (void)H5Tset_cset(mem.get(), cset);

    if (H5Tis_variable_str(ftype) > 0) {
      (void)H5Tset_size(mem.get(), H5T_VARIABLE);
      std::vector<char*> buf(n, nullptr);
      const herr_t rc = is_attr ? H5Aread(obj, mem.get(), buf.data())
                                : H5Dread(obj, mem.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buf.data());
      if (rc < 0) throw ResultReadError(path_, "cannot read strings of '" + what + "'");
      out.reserve(n);
      for (char* p : buf) out.push_back(decode_c(p, cset));
      (void)H5Dvlen_reclaim(mem.get(), space, H5P_DEFAULT, buf.data());
      return out;
    }

    const std::size_t size = H5Tget_size(ftype);
    (void)H5Tset_size(mem.get(), size);
    (void)H5Tset_strpad(mem.get(), H5T_STR_NULLPAD);
    std::vector<char> buf(n * size);
    const herr_t rc = is_attr ? H5Aread(obj, mem.get(), buf.data())
                              : H5Dread(obj, mem.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buf.data());
    if (rc < 0) throw ResultReadError(path_, "cannot read strings of '" + what + "'");
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) out.push_back(decode(buf.data() + i * size, size, cset));
    return out;
  }

  void read_group(const std::string& p) {
    H5Handle g = h5_group(H5Gopen2(file_.get(), p.c_str(), H5P_DEFAULT));
    if (!g) throw ResultReadError(path_, "cannot open group '" + p + "'");
    RawDataset d;
    d.path = p;
    d.is_group = true;
    d.attributes = attributes(g.get(), p);
    out_->datasets.push_back(std::move(d));
  }

  void read_dataset(const std::string& p) {
    H5Handle ds = h5_dataset(H5Dopen2(file_.get(), p.c_str(), H5P_DEFAULT));
    if (!ds) throw ResultReadError(path_, "cannot open dataset '" + p + "'");
    H5Handle type = h5_type(H5Dget_type(ds.get()));
    H5Handle space = h5_space(H5Dget_space(ds.get()));

    const int ndims = H5Sget_simple_extent_ndims(space.get());
    if (ndims < 0) throw ResultReadError(path_, "cannot read shape of '" + p + "'");
    std::vector<hsize_t> dims(static_cast<std::size_t>(ndims));
    if (ndims > 0) (void)H5Sget_simple_extent_dims(space.get(), dims.data(), nullptr);
    const hssize_t np = H5Sget_simple_extent_npoints(space.get());
    const std::size_t n = np > 0 ? static_cast<std::size_t>(np) : 0;

    RawDataset base;
    base.path = p;
    for (hsize_t d : dims) base.shape.push_back(static_cast<std::size_t>(d));
    base.attributes = attributes(ds.get(), p);

    const H5T_class_t cls = H5Tget_class(type.get());
    if (is_numeric_class(cls)) {
      base.numbers.resize(n);
      if (n > 0 && H5Dread(ds.get(), H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT,
                           base.numbers.data()) < 0) {
        throw ResultReadError(path_, "cannot read dataset '" + p + "'");
      }
      out_->datasets.push_back(std::move(base));
    } else if (cls == H5T_STRING) {
      base.strings = read_strings(ds.get(), false, type.get(), space.get(), n, p);
      out_->datasets.push_back(std::move(base));
    } else if (cls == H5T_COMPOUND) {
      read_compound(ds.get(), type.get(), space.get(), n, base);
    } else {
      out_->warnings.push_back(path_ + ": dataset '" + p + "' has an unsupported datatype; skipped");
    }
  }

  // One RawDataset per member: "<path>/<member>", same shape and attributes.
  void read_compound(hid_t ds, hid_t ftype, hid_t space, std::size_t n, const RawDataset& base) {
    const int members = H5Tget_nmembers(ftype);
    for (int i = 0; i < members; ++i) {
      char* raw_name = H5Tget_member_name(ftype, static_cast<unsigned>(i));
      if (!raw_name) continue;
      const std::string member(raw_name);
      H5free_memory(raw_name);

      H5Handle mtype = h5_type(H5Tget_member_type(ftype, static_cast<unsigned>(i)));
      const H5T_class_t mcls = H5Tget_class(mtype.get());

      RawDataset d;
      d.path = base.path + "/" + member;
      d.shape = base.shape;
      d.attributes = base.attributes;

      if (is_numeric_class(mcls)) {
        H5Handle mem = h5_type(H5Tcreate(H5T_COMPOUND, sizeof(double)));
        (void)H5Tinsert(mem.get(), member.c_str(), 0, H5T_NATIVE_DOUBLE);
        d.numbers.resize(n);
        if (n > 0 && H5Dread(ds, mem.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, d.numbers.data()) < 0) {
          throw ResultReadError(path_, "cannot read member '" + d.path + "'");
        }
      } else if (mcls == H5T_STRING) {
        d.strings = read_string_member(ds, mtype.get(), space, n, member, d.path);
      } else {
        out_->warnings.push_back(path_ + ": member '" + d.path + "' has an unsupported datatype; skipped");
        continue;
      }
      out_->datasets.push_back(std::move(d));
    }
  }

  std::vector<std::string> read_string_member(hid_t ds, hid_t mtype, hid_t space, std::size_t n,
                                              const std::string& member, const std::string& what) {
    std::vector<std::string> out;
    if (n == 0) return out;
    const H5T_cset_t cset = H5Tget_cset(mtype);
    H5Handle str = h5_type(H5Tcopy(H5T_C_S1));
    (void)H5Tset_cset(str.get(), cset);

    if (H5Tis_variable_str(mtype) > 0) {
      (void)H5Tset_size(str.get(), H5T_VARIABLE);
      H5Handle mem = h5_type(H5Tcreate(H5T_COMPOUND, sizeof(char*)));
      (void)H5Tinsert(mem.get(), member.c_str(), 0, str.get());
      std::vector<char*> buf(n, nullptr);
      if (H5Dread(ds, mem.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buf.data()) < 0) {
        throw ResultReadError(path_, "cannot read member '" + what + "'");
      }
      out.reserve(n);
      for (char* p : buf) out.push_back(decode_c(p, cset));
      (void)H5Dvlen_reclaim(mem.get(), space, H5P_DEFAULT, buf.data());
      return out;
    }

    const std::size_t size = H5Tget_size(mtype);
    (void)H5Tset_size(str.get(), size);
    (void)H5Tset_strpad(str.get(), H5T_STR_NULLPAD);
    H5Handle mem = h5_type(H5Tcreate(H5T_COMPOUND, size));
    (void)H5Tinsert(mem.get(), member.c_str(), 0, str.get());
    std::vector<char> buf(n * size);
    if (H5Dread(ds, mem.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buf.data()) < 0) {
      throw ResultReadError(path_, "cannot read member '" + what + "'");
    }
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) out.push_back(decode(buf.data() + i * size, size, cset));
    return out;
  }

  std::string path_;
  ParsedResultFile* out_;
  H5Handle file_;
};

void check_signature(const std::string& path, const IoSettings& io) {
  const std::string head = read_file_prefix(path, kSignature.size(), io);
  if (head != kSignature) throw ResultReadError(path, "missing HDF5 signature");
}

SourceRef result_source(const std::string& path) {
  SourceRef s = make_source(path);
  s.kind = FileKind::kResult;
  return s;
}

} // namespace

ParsedResultFile read_result_datasets(const std::string& path,
                                      const std::vector<std::string>& globs,
                                      const IoSettings& io) {
  check_signature(path, io);

  ParsedResultFile out;
  out.source = result_source(path);

  std::lock_guard<std::mutex> lock(hdf5_mutex());
  Reader r(path, &out);
  r.open();
  r.validate_schema();
  r.read(globs);
  return out;
}

ParsedResultFile read_result_file(const std::string& path,
                                  const Settings& settings,
                                  const ResultLayoutRegistry& registry) {
  check_signature(path, settings.io);

  ParsedResultFile out;
  out.source = result_source(path);

  std::lock_guard<std::mutex> lock(hdf5_mutex());
  Reader r(path, &out);
  r.open();
  r.validate_schema();

  const int major = version_major(out.file_version);
  const ResultLayout* layout = registry.select(major);
  if (!layout) throw ResultReadError(path, "no result layouts registered");
  if (major < 0 || major < layout->min_major) {
    out.warnings.push_back(path + ": 'File Version' '" + out.file_version +
                           "' predates known layouts; using " + layout->name);
  }
  out.layout_name = layout->name;
  r.read(layout->globs());
  return out;
}

} // namespace rascheck::results
