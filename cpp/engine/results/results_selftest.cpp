/*
  HDF5 result reader selftest

  Writes small result containers with the HDF5 C API, then checks:
    1) float32 / int32 data come back widened to double;
    2) compound tables split into per-member datasets;
    3) fixed and variable-length strings decode (ASCII high bytes -> '?');
    4) matched groups yield attribute-only entries;
    5) globs with no match give an empty result;
    6) wrong signature / foreign root markers -> ResultReadError.

  Framework-free; non-zero exit on failure.
*/

#include <hdf5.h>

#include <chrono>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

#include "engine/core/errors.hpp"
#include "engine/core/file_io.hpp"
#include "engine/core/settings.hpp"
#include "engine/results/h5_handle.hpp"
#include "engine/results/path_glob.hpp"
#include "engine/results/result_reader.hpp"

namespace rascheck {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

using results::H5Handle;

const char* kProfiles = "Results/Steady/Output/Output Blocks/Base Output/Steady Profiles";

void put_fixed_attr(hid_t obj, const char* name, const std::string& value) {
  H5Handle type = results::h5_type(H5Tcopy(H5T_C_S1));
  H5Tset_size(type.get(), value.size() + 1);
  H5Handle space = results::h5_space(H5Screate(H5S_SCALAR));
  H5Handle attr = results::h5_attr(H5Acreate2(obj, name, type.get(), space.get(), H5P_DEFAULT, H5P_DEFAULT));
  H5Awrite(attr.get(), type.get(), value.c_str());
}

void put_vlen_attr(hid_t obj, const char* name, const std::string& value) {
  H5Handle type = results::h5_type(H5Tcopy(H5T_C_S1));
  H5Tset_size(type.get(), H5T_VARIABLE);
  H5Handle space = results::h5_space(H5Screate(H5S_SCALAR));
  H5Handle attr = results::h5_attr(H5Acreate2(obj, name, type.get(), space.get(), H5P_DEFAULT, H5P_DEFAULT));
  const char* p = value.c_str();
  H5Awrite(attr.get(), type.get(), &p);
}

H5Handle intermediate_lcpl() {
  H5Handle lcpl = results::h5_plist(H5Pcreate(H5P_LINK_CREATE));
  H5Pset_create_intermediate_group(lcpl.get(), 1);
  return lcpl;
}

struct XsRow {
  char river[16];
  char reach[16];
  char rs[8];
  float contr;
  float expan;
  float len_channel;
};

void write_fixture(const std::string& path, bool with_markers) {
  results::hdf5_quiet();
  H5Handle file = results::h5_file(H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT));
  if (with_markers) {
    put_fixed_attr(file.get(), "File Type", "HEC-RAS Results");
    put_fixed_attr(file.get(), "File Version", "HEC-RAS 6.3.1 September 2022");
  } else {
    put_fixed_attr(file.get(), "File Type", "Something Else");
  }
  H5Handle lcpl = intermediate_lcpl();

  {
    H5Handle g = results::h5_group(H5Gcreate2(file.get(), "Plan Data/Plan Information", lcpl.get(),
                                              H5P_DEFAULT, H5P_DEFAULT));
    put_vlen_attr(g.get(), "Plan ShortID", "Existing");
    put_fixed_attr(g.get(), "Plan Title", "Existing Conditions");
  }

  {
    H5Handle s16 = results::h5_type(H5Tcopy(H5T_C_S1));
    H5Tset_size(s16.get(), 16);
    H5Handle s8 = results::h5_type(H5Tcopy(H5T_C_S1));
    H5Tset_size(s8.get(), 8);
    H5Handle row = results::h5_type(H5Tcreate(H5T_COMPOUND, sizeof(XsRow)));
    H5Tinsert(row.get(), "River", HOFFSET(XsRow, river), s16.get());
    H5Tinsert(row.get(), "Reach", HOFFSET(XsRow, reach), s16.get());
    H5Tinsert(row.get(), "RS", HOFFSET(XsRow, rs), s8.get());
    H5Tinsert(row.get(), "Contr", HOFFSET(XsRow, contr), H5T_NATIVE_FLOAT);
    H5Tinsert(row.get(), "Expan", HOFFSET(XsRow, expan), H5T_NATIVE_FLOAT);
    H5Tinsert(row.get(), "Len Channel", HOFFSET(XsRow, len_channel), H5T_NATIVE_FLOAT);

    XsRow rows[2];
    std::memset(rows, 0, sizeof(rows));
    std::strcpy(rows[0].river, "Caf\xE9 Creek");
    std::strcpy(rows[0].reach, "Main");
    std::strcpy(rows[0].rs, "5000");
    rows[0].contr = 0.1f;
    rows[0].expan = 0.3f;
    rows[0].len_channel = 120.0f;
    std::strcpy(rows[1].river, "Caf\xE9 Creek");
    std::strcpy(rows[1].reach, "Main");
    std::strcpy(rows[1].rs, "4000");
    rows[1].contr = 0.3f;
    rows[1].expan = 0.5f;
    rows[1].len_channel = 0.0f;

    hsize_t dims[1] = {2};
    H5Handle space = results::h5_space(H5Screate_simple(1, dims, nullptr));
    H5Handle ds = results::h5_dataset(H5Dcreate2(file.get(), "Geometry/Cross Sections/Attributes",
                                                 row.get(), space.get(), lcpl.get(), H5P_DEFAULT,
                                                 H5P_DEFAULT));
    H5Dwrite(ds.get(), row.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, rows);
  }

  {
    const char names[2][8] = {"10yr", "100yr"};
    H5Handle s8 = results::h5_type(H5Tcopy(H5T_C_S1));
    H5Tset_size(s8.get(), 8);
    hsize_t dims[1] = {2};
    H5Handle space = results::h5_space(H5Screate_simple(1, dims, nullptr));
    const std::string p = std::string(kProfiles) + "/Profile Names";
    H5Handle ds = results::h5_dataset(H5Dcreate2(file.get(), p.c_str(), s8.get(), space.get(),
                                                 lcpl.get(), H5P_DEFAULT, H5P_DEFAULT));
    H5Dwrite(ds.get(), s8.get(), H5S_ALL, H5S_ALL, H5P_DEFAULT, names);
  }

  {
    const float ws[2][2] = {{101.5f, 99.25f}, {103.75f, 100.5f}};
    hsize_t dims[2] = {2, 2};
    H5Handle space = results::h5_space(H5Screate_simple(2, dims, nullptr));
    const std::string p = std::string(kProfiles) + "/Cross Sections/Water Surface";
    H5Handle ds = results::h5_dataset(H5Dcreate2(file.get(), p.c_str(), H5T_IEEE_F32LE, space.get(),
                                                 lcpl.get(), H5P_DEFAULT, H5P_DEFAULT));
    H5Dwrite(ds.get(), H5T_NATIVE_FLOAT, H5S_ALL, H5S_ALL, H5P_DEFAULT, ws);
    put_fixed_attr(ds.get(), "Units", "ft");
  }

  {
    const int flow[2][2] = {{1000, 1000}, {5000, 5000}};
    hsize_t dims[2] = {2, 2};
    H5Handle space = results::h5_space(H5Screate_simple(2, dims, nullptr));
    const std::string p = std::string(kProfiles) + "/Cross Sections/Flow";
    H5Handle ds = results::h5_dataset(H5Dcreate2(file.get(), p.c_str(), H5T_STD_I32LE, space.get(),
                                                 lcpl.get(), H5P_DEFAULT, H5P_DEFAULT));
    H5Dwrite(ds.get(), H5T_NATIVE_INT, H5S_ALL, H5S_ALL, H5P_DEFAULT, flow);
  }
}

void test_globs() {
  expect_true(results::glob_match("Geometry/*/Attributes", "Geometry/Cross Sections/Attributes"),
              "* matches one segment");
  expect_true(!results::glob_match("Geometry/*", "Geometry/Cross Sections/Attributes"),
              "* does not cross '/'");
  expect_true(results::glob_match("Results/**/Water Surface",
                                  "Results/Steady/Output/Output Blocks/Water Surface"),
              "** spans segments");
  expect_true(results::glob_match("Results/**", "Results"), "** matches zero segments");
  expect_true(results::glob_match("/Plan Data/Plan Info*/", "Plan Data/Plan Information"),
              "Leading / trailing slashes ignored, * inside a segment");
  expect_true(!results::glob_match("Plan Data/Plan ?nfo", "Plan Data/Plan Information"),
              "? is exactly one character");
}

void test_read_fixture(const std::filesystem::path& dir) {
  const std::string path = (dir / "model.p01.hdf").string();
  write_fixture(path, true);

  const auto r = results::read_result_file(path, Settings::defaults());
  expect_true(r.source.id == "p01" && r.source.kind == FileKind::kResult, "Result source id");
  expect_true(r.file_type == "HEC-RAS Results", "File Type marker");
  expect_true(r.layout_name == "results_v6", "File Version 6 selects the v6 layout");

  const auto* rs = r.find("Geometry/Cross Sections/Attributes/RS");
  expect_true(rs && rs->strings.size() == 2 && rs->strings[0] == "5000", "Compound string member");
  const auto* river = r.find("Geometry/Cross Sections/Attributes/River");
  expect_true(river && river->strings[0] == "Caf? Creek", "ASCII high byte replaced with '?'");

  const auto* contr = r.find("Geometry/Cross Sections/Attributes/Contr");
  expect_true(contr && contr->numbers.size() == 2, "Compound numeric member");
  expect_true(contr && contr->numbers[0] == static_cast<double>(0.1f), "float32 member widened exactly");

  const std::string cs = std::string(kProfiles) + "/Cross Sections/";
  const auto* ws = r.find(cs + "Water Surface");
  expect_true(ws && ws->shape.size() == 2 && ws->shape[0] == 2 && ws->shape[1] == 2, "2-D shape kept");
  expect_true(ws && ws->at(1, 0) == 103.75, "float32 dataset widened to double");
  expect_true(ws && ws->attributes.count("Units") == 1, "Dataset attributes read");

  const auto* flow = r.find(cs + "Flow");
  expect_true(flow && flow->at(1, 1) == 5000.0, "int32 dataset widened to double");

  const auto* names = r.find(std::string(kProfiles) + "/Profile Names");
  expect_true(names && names->strings.size() == 2 && names->strings[1] == "100yr", "Profile names");

  const auto* plan = r.find("Plan Data/Plan Information");
  expect_true(plan && plan->is_group && plan->size() == 0, "Group entry has no values");
  bool short_id = false;
  if (plan) {
    const auto it = plan->attributes.find("Plan ShortID");
    short_id = it != plan->attributes.end() && std::get<std::string>(it->second) == "Existing";
  }
  expect_true(short_id, "Variable-length string attribute");

  const auto none = results::read_result_datasets(path, {"Results/Unsteady/**"}, Settings::defaults().io);
  expect_true(none.datasets.empty(), "Absent optional group yields no datasets");
}

void test_bad_inputs(const std::filesystem::path& dir) {
  const std::string text = (dir / "fake.p01.hdf").string();
  write_text_file(text, "this is not an HDF5 file\n");
  bool sig = false;
  try {
    (void)results::read_result_file(text, Settings::defaults());
  } catch (const ResultReadError& e) {
    sig = std::string(e.what()).find("signature") != std::string::npos;
  }
  expect_true(sig, "Wrong signature raises ResultReadError");

  const std::string foreign = (dir / "foreign.p01.hdf").string();
  write_fixture(foreign, false);
  bool schema = false;
  try {
    (void)results::read_result_file(foreign, Settings::defaults());
  } catch (const ResultReadError&) {
    schema = true;
  }
  expect_true(schema, "Foreign root markers raise ResultReadError");

  bool io = false;
  try {
    (void)results::read_result_file((dir / "missing.p01.hdf").string(), Settings::defaults());
  } catch (const IoError&) {
    io = true;
  }
  expect_true(io, "Missing container raises IoError");
}

} // namespace
} // namespace rascheck

int main() {
  using namespace rascheck;

  const auto dir = std::filesystem::temp_directory_path() /
                   ("rascheck_results_selftest_" +
                    std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
  std::filesystem::create_directories(dir);

  test_globs();
  try {
    test_read_fixture(dir);
    test_bad_inputs(dir);
  } catch (const std::exception& e) {
    fail(std::string("unexpected exception: ") + e.what());
  }

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  if (g_fail_count != 0) {
    std::cerr << "\nSelftest failures: " << g_fail_count << "\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
