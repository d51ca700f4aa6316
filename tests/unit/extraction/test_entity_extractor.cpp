#include <gtest/gtest.h>
#include "ckg/extraction/entity_extractor.hpp"
#include "ckg/utils/hash_utils.hpp"
#include <filesystem>
#include <fstream>

using namespace ckg;
using namespace ckg::extraction;
namespace fs = std::filesystem;

class EntityExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        temp_dir = fs::temp_directory_path() / (std::string("ckg_entity_extractor_") + info->name());
        fs::remove_all(temp_dir);
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    void create_file(const fs::path& relative, const std::string& content) const {
        const fs::path full = temp_dir / relative;
        fs::create_directories(full.parent_path());
        std::ofstream file(full, std::ios::binary);
        file << content;
        file.close();
    }

    fs::path temp_dir;
};

TEST_F(EntityExtractorTest, DiscoverFilesFiltersAndSorts) {
    create_file("src/b.py", "x = 1\n");
    create_file("src/a.ts", "export const a = 1;\n");
    create_file("deep/nested/c.cpp", "int main() {}\n");
    create_file("README.md", "# readme\n");
    create_file("node_modules/lib/index.js", "module.exports = {};\n");
    create_file(".git/hooks/x.js", "\n");

    auto result = discover_files(temp_dir, DiscoveryConfig{});
    ASSERT_TRUE(result.is_ok());

    const std::vector<fs::path> expected = {
        (temp_dir / "deep/nested/c.cpp").lexically_normal(),
        (temp_dir / "src/a.ts").lexically_normal(),
        (temp_dir / "src/b.py").lexically_normal()
    };
    EXPECT_EQ(result.value().files, expected);
}

TEST_F(EntityExtractorTest, DiscoverFilesHonoursCustomExcludes) {
    create_file("src/a.ts", "\n");
    create_file("generated/b.ts", "\n");

    DiscoveryConfig config;
    config.exclude_dirs = {"generated"};

    auto result = discover_files(temp_dir, config);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().files.size(), 1u);
    EXPECT_EQ(result.value().files[0].filename(), "a.ts");
}

TEST_F(EntityExtractorTest, DiscoverFilesSkipsOversizedFiles) {
    create_file("small.js", "a();\n");
    create_file("large.js", std::string(64, 'x'));

    DiscoveryConfig config;
    config.max_file_size_bytes = 16;

    auto result = discover_files(temp_dir, config);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().files.size(), 1u);
    EXPECT_EQ(result.value().files[0].filename(), "small.js");
}

TEST_F(EntityExtractorTest, DiscoverFilesMissingRoot) {
    auto result = discover_files(temp_dir / "missing", DiscoveryConfig{});

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
}

TEST_F(EntityExtractorTest, DiscoverFilesRootIsAFile) {
    create_file("a.ts", "\n");
    auto result = discover_files(temp_dir / "a.ts", DiscoveryConfig{});

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(EntityExtractorTest, DiscoverFilesCancelled) {
    create_file("a.ts", "\n");
    const auto token = CancellationToken::create();
    token.cancel();

    auto result = discover_files(temp_dir, DiscoveryConfig{}, token);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::Cancelled);
}

TEST_F(EntityExtractorTest, DetectLanguage) {
    EXPECT_EQ(detect_language("a.ts"), "typescript");
    EXPECT_EQ(detect_language("a.JSX"), "javascript");
    EXPECT_EQ(detect_language("pkg/mod.py"), "python");
    EXPECT_EQ(detect_language("x.h"), "cpp");
    EXPECT_EQ(detect_language("x.c"), "c");
    EXPECT_EQ(detect_language("Program.cs"), "csharp");
    EXPECT_EQ(detect_language("notes.txt"), "unknown");
}

TEST_F(EntityExtractorTest, FileImportance) {
    EXPECT_DOUBLE_EQ(compute_file_importance("lib/a.ts", 100), 0.6);
    EXPECT_DOUBLE_EQ(compute_file_importance("src/index.ts", 0), 0.8);
    EXPECT_DOUBLE_EQ(compute_file_importance("src/Main.java", 0), 0.8);
    EXPECT_DOUBLE_EQ(compute_file_importance("src/config/utils.ts", 500), 1.0);
    EXPECT_DOUBLE_EQ(compute_file_importance("lib/a.ts", 5000), 0.8);
}

TEST_F(EntityExtractorTest, FileComplexity) {
    EXPECT_DOUBLE_EQ(compute_file_complexity("function a() {\n  if (x) {}\n}"), 2.0 / 3.0);
    EXPECT_DOUBLE_EQ(compute_file_complexity("const a = 1;"), 0.0);
}

TEST_F(EntityExtractorTest, ExtractFileBuildsFileNode) {
    create_file("src/index.ts", "export function boot() {\n  return start();\n}\n");
    const fs::path path = (temp_dir / "src/index.ts").lexically_normal();

    const EntityExtractor extractor;
    auto result = extractor.extract_file(temp_dir, path);
    ASSERT_TRUE(result.is_ok());

    const auto& extraction = result.value();
    EXPECT_EQ(extraction.language, "typescript");

    const Node& node = extraction.file_node;
    EXPECT_EQ(node.id, hash_utils::make_node_id(NodeType::File, path.generic_string()));
    EXPECT_EQ(node.type, NodeType::File);
    EXPECT_EQ(node.name, "index.ts");
    EXPECT_EQ(node.text(meta::LANGUAGE), "typescript");
    EXPECT_EQ(node.text(meta::EXTENSION), ".ts");
    EXPECT_EQ(node.number(meta::LINE_COUNT), 4.0);
    EXPECT_NEAR(node.importance, 0.804, 1e-9);

    ASSERT_EQ(extraction.entities.size(), 1u);
    EXPECT_EQ(extraction.entities[0].name, "boot");
    ASSERT_EQ(extraction.usages.size(), 1u);
    EXPECT_EQ(extraction.usages[0].name, "start");
}

TEST_F(EntityExtractorTest, ExtractFileWithoutExtractor) {
    create_file("main.go", "package main\n\nfunc main() {}\n");

    const EntityExtractor extractor;
    auto result = extractor.extract_file(temp_dir, temp_dir / "main.go");
    ASSERT_TRUE(result.is_ok());

    EXPECT_EQ(result.value().language, "go");
    EXPECT_TRUE(result.value().entities.empty());
    EXPECT_EQ(result.value().file_node.type, NodeType::File);
}

TEST_F(EntityExtractorTest, ExtractMissingFile) {
    const EntityExtractor extractor;
    auto result = extractor.extract_file(temp_dir, temp_dir / "gone.ts");

    EXPECT_TRUE(result.is_err());
}

TEST_F(EntityExtractorTest, ExtractFileRejectsOverlongLines) {
    create_file("bundle.js",
                "const data = \"data:image/png;base64," + std::string(200000, 'A') + "\";\n"
                "export function render() {}\n");

    const EntityExtractor extractor;
    auto result = extractor.extract_file(temp_dir, temp_dir / "bundle.js");

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::ExtractionError);
}

TEST_F(EntityExtractorTest, LineLimitIsConfigurable) {
    create_file("wide.js", "const label = '" + std::string(100, 'x') + "';\n");

    const EntityExtractor strict(ExtractorRegistry::with_builtin(), 50);
    EXPECT_TRUE(strict.extract_file(temp_dir, temp_dir / "wide.js").is_err());

    const EntityExtractor relaxed(ExtractorRegistry::with_builtin(), 200);
    auto result = relaxed.extract_file(temp_dir, temp_dir / "wide.js");
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().entities.size(), 1u);
    EXPECT_EQ(result.value().entities[0].name, "label");
}

namespace {
    class GoStubExtractor final : public ILanguageExtractor {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "go_stub";
        }

        [[nodiscard]] std::vector<std::string> languages() const override {
            return {"go"};
        }

        [[nodiscard]] LanguageExtraction extract(std::string_view, std::string_view) const override {
            LanguageExtraction out;
            EntityCandidate candidate;
            candidate.type = NodeType::Function;
            candidate.name = "main";
            candidate.line = 3;
            add_candidate(out, std::move(candidate));
            return out;
        }
    };
}

TEST_F(EntityExtractorTest, RegistryLaterRegistrationWins) {
    auto registry = ExtractorRegistry::with_builtin();
    EXPECT_EQ(registry.find("go"), nullptr);
    EXPECT_EQ(registry.find("python")->name(), "python");
    EXPECT_EQ(registry.list_extractors().size(), 3u);

    registry.register_extractor(std::make_shared<GoStubExtractor>());
    ASSERT_NE(registry.find("go"), nullptr);
    EXPECT_EQ(registry.find("go")->name(), "go_stub");

    create_file("main.go", "package main\n\nfunc main() {}\n");
    const EntityExtractor extractor(std::move(registry));
    auto result = extractor.extract_file(temp_dir, temp_dir / "main.go");
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().entities.size(), 1u);
    EXPECT_EQ(result.value().entities[0].name, "main");
}

TEST_F(EntityExtractorTest, AddCandidateRejectsInvalidNames) {
    LanguageExtraction out;
    EntityCandidate candidate;
    candidate.name = "9lives";

    EXPECT_FALSE(add_candidate(out, candidate));
    EXPECT_EQ(out.ambiguous, 1u);
    EXPECT_TRUE(out.entities.empty());
}
