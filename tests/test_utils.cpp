#include "test_utils.hpp"

#include <atomic>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <zlib.h>

#include "utility.hpp"

namespace {
class QuietLogs : public ::testing::Environment {
public:
    void SetUp() override { logging::set_quiet(true); }
};

::testing::Environment* const quiet_env =
    ::testing::AddGlobalTestEnvironment(new QuietLogs);

std::atomic<int> dir_counter{0};
} // anonymous namespace

namespace test_utils {

const char* REPORT_HEADER = "id,strand,fivelen,threelen,polyAlen,insertlen,primer";

void TempDirTest::SetUp() {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir = std::filesystem::temp_directory_path() /
        ("refineqc_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
         std::to_string(dir_counter++));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
}

void TempDirTest::TearDown() {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

std::filesystem::path TempDirTest::write_file(const std::string& name, const std::string& content) const {
    auto path = dir / name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path;
}

std::filesystem::path TempDirTest::write_gz(const std::string& name, const std::string& content) const {
    auto path = dir / name;
    gzFile gz = gzopen(path.string().c_str(), "wb");
    if (!gz) {
        throw std::runtime_error("cannot create " + path.string());
    }
    gzwrite(gz, content.data(), static_cast<unsigned>(content.size()));
    gzclose(gz);
    return path;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace test_utils
