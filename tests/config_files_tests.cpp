#include <gtest/gtest.h>
#include "io/ConfigFiles.h"
#include "kernel/Model.h"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {
// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : path_(fs::temp_directory_path() / ("econsim_" + name + "_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()))) {
        fs::remove_all(path_);
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    const fs::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    fs::path path_;
};

void writeText(const fs::path& path, const std::string& text) {
    std::ofstream out(path);
    out << text;
}
}

TEST(ConfigFilesTest, TemplatesLoad) {
    TempDir dir("templates");
    generateTemplateFiles(dir.str());

    const auto countries = loadCountryConfigs((dir.path() / kCountryParamsFile).string());
    ASSERT_EQ(countries.size(), 2u);
    EXPECT_EQ(countries[0].country_id.value(), 1);
    EXPECT_EQ(countries[0].name.value(), "Developed Country");
    EXPECT_DOUBLE_EQ(countries[0].tax_rate.value(), 0.35);
    EXPECT_EQ(countries[1].external_influences.value(), -30);
    EXPECT_FALSE(countries[0].bonds_issued.has_value());

    const auto citizens = loadCitizenParams((dir.path() / kCitizenParamsFile).string());
    ASSERT_TRUE(citizens.high.has_value());
    ASSERT_TRUE(citizens.low.has_value());
    EXPECT_FALSE(citizens.medium.has_value());
    EXPECT_EQ(citizens.high->salary.min, 60);
    EXPECT_EQ(citizens.high->salary.max, 120);
    EXPECT_DOUBLE_EQ(citizens.low->initial_employment_rate, 0.6);

    const auto businesses = loadBusinessParams((dir.path() / kBusinessParamsFile).string());
    ASSERT_TRUE(businesses.high.has_value());
    EXPECT_DOUBLE_EQ(businesses.high->type_weights[static_cast<std::size_t>(BusinessType::AI)], 0.15);
    EXPECT_DOUBLE_EQ(businesses.low->type_weights[static_cast<std::size_t>(BusinessType::AI)], 0.0);
    EXPECT_DOUBLE_EQ(businesses.low->size_factor.max, 1.5);
}

TEST(ConfigFilesTest, MissingFilesGenerateTemplates) {
    TempDir dir("missing");
    const LoadedConfig loaded = loadConfigDirectory(dir.str());

    EXPECT_TRUE(fs::exists(dir.path() / kCountryParamsFile));
    EXPECT_TRUE(fs::exists(dir.path() / kCitizenParamsFile));
    EXPECT_TRUE(fs::exists(dir.path() / kBusinessParamsFile));
    EXPECT_EQ(loaded.countries.size(), 2u);
}

TEST(ConfigFilesTest, LoadedConfigDrivesModel) {
    TempDir dir("model");
    const LoadedConfig loaded = loadConfigDirectory(dir.str());

    ModelConfig cfg;
    cfg.sizes.citizens_per_country = 20;
    cfg.sizes.businesses_per_country = 4;
    cfg.countries = loaded.countries;
    cfg.citizenParams = loaded.citizenParams;
    cfg.businessParams = loaded.businessParams;
    Model model(cfg);

    ASSERT_EQ(model.countries().size(), 2u);
    EXPECT_EQ(model.country(0).tier(), DevelopmentTier::High);
    EXPECT_EQ(model.country(1).tier(), DevelopmentTier::Low);
    for (const auto& c : model.country(0).citizens()) {
        EXPECT_GE(c.salary, 60.0);
        EXPECT_LE(c.salary, 120.0);
    }
    for (const auto& b : model.country(1).businesses()) {
        EXPECT_NE(b.type(), BusinessType::AI);
    }
    model.stepN(3);
    EXPECT_EQ(model.metrics().length(), 3u);
}

TEST(ConfigFilesTest, EmptyCellsAreUnset) {
    TempDir dir("empty_cells");
    const fs::path file = dir.path() / kCountryParamsFile;
    writeText(file,
              "country_id,name,development_level,tax_rate\n"
              "5,,0.5,\n");

    const auto countries = loadCountryConfigs(file.string());
    ASSERT_EQ(countries.size(), 1u);
    EXPECT_EQ(countries[0].country_id.value(), 5);
    EXPECT_FALSE(countries[0].name.has_value());
    EXPECT_FALSE(countries[0].tax_rate.has_value());
    EXPECT_DOUBLE_EQ(countries[0].development_level.value(), 0.5);
}

TEST(ConfigFilesTest, QuotedNames) {
    TempDir dir("quoted");
    const fs::path file = dir.path() / kCountryParamsFile;
    writeText(file,
              "country_id,name\n"
              "1,\"Republic of A, B\"\n");

    const auto countries = loadCountryConfigs(file.string());
    ASSERT_EQ(countries.size(), 1u);
    EXPECT_EQ(countries[0].name.value(), "Republic of A, B");
}

TEST(ConfigFilesTest, MalformedFilesThrow) {
    TempDir dir("malformed");
    const fs::path countries = dir.path() / kCountryParamsFile;
    writeText(countries, "country_id,tax_rate\n1,abc\n");
    EXPECT_THROW(loadCountryConfigs(countries.string()), std::runtime_error);

    writeText(countries, "country_id,tax_rate\n1\n");
    EXPECT_THROW(loadCountryConfigs(countries.string()), std::runtime_error);

    const fs::path businesses = dir.path() / kBusinessParamsFile;
    writeText(businesses, "development_level,min_automation_level\nhigh,0.1\n");
    EXPECT_THROW(loadBusinessParams(businesses.string()), std::runtime_error);

    generateTemplateFiles(dir.str());
    const fs::path citizens = dir.path() / kCitizenParamsFile;
    std::ifstream in(citizens);
    std::string header;
    std::getline(in, header);
    std::string row;
    std::getline(in, row);
    in.close();
    writeText(citizens, header + "\nultra" + row.substr(row.find(',')) + "\n");
    EXPECT_THROW(loadCitizenParams(citizens.string()), std::runtime_error);

    EXPECT_THROW(loadCountryConfigs((dir.path() / "absent.csv").string()), std::runtime_error);
}
