#include "ckg/extraction/javascript_extractor.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace ckg::extraction
{
    namespace {
        const EntityCandidate* find_entity(const LanguageExtraction& out, const NodeType type, const std::string& name) {
            const auto it = std::find_if(out.entities.begin(), out.entities.end(), [&](const EntityCandidate& e) {
                return e.type == type && e.name == name;
            });
            return it == out.entities.end() ? nullptr : &*it;
        }

        constexpr auto kSource = R"(import { helper } from './utils';
import React from 'react';
const lodash = require('lodash');

export async function fetchUser(id) {
  if (!id) {
    return null;
  }
  return helper(id);
}

const formatName = (user) => user.name;

export abstract class BaseRepository {
}

export class UserRepository extends BaseRepository implements Repository, Cache {
  private constructor() { super(); }
}

interface Repository {
  find(id: string): User;
}

let counter = 0;
)";
    }

    class JavaScriptExtractorTest : public ::testing::Test {
    protected:
        JavaScriptExtractor extractor_;
    };

    TEST_F(JavaScriptExtractorTest, Languages) {
        EXPECT_EQ(extractor_.name(), "javascript");
        EXPECT_EQ(extractor_.languages(), (std::vector<std::string>{"javascript", "typescript"}));
    }

    TEST_F(JavaScriptExtractorTest, FunctionDeclarations) {
        const auto out = extractor_.extract(kSource, "typescript");

        const auto* fetch_user = find_entity(out, NodeType::Function, "fetchUser");
        ASSERT_NE(fetch_user, nullptr);
        EXPECT_EQ(fetch_user->line, 5u);
        ASSERT_TRUE(fetch_user->function.has_value());
        EXPECT_TRUE(fetch_user->function->is_async);
        EXPECT_GT(fetch_user->function->complexity, 1.0);
        EXPECT_DOUBLE_EQ(fetch_user->importance, 0.7);
    }

    TEST_F(JavaScriptExtractorTest, ArrowFunctionIsNotAVariable) {
        const auto out = extractor_.extract(kSource, "typescript");

        const auto* format_name = find_entity(out, NodeType::Function, "formatName");
        ASSERT_NE(format_name, nullptr);
        EXPECT_FALSE(format_name->function->is_async);
        EXPECT_EQ(find_entity(out, NodeType::Variable, "formatName"), nullptr);
    }

    TEST_F(JavaScriptExtractorTest, Classes) {
        const auto out = extractor_.extract(kSource, "typescript");

        const auto* base = find_entity(out, NodeType::Class, "BaseRepository");
        ASSERT_NE(base, nullptr);
        ASSERT_TRUE(base->class_info.has_value());
        EXPECT_TRUE(base->class_info->is_abstract);
        EXPECT_TRUE(base->class_info->extends.empty());

        const auto* repo = find_entity(out, NodeType::Class, "UserRepository");
        ASSERT_NE(repo, nullptr);
        EXPECT_EQ(repo->class_info->extends, "BaseRepository");
        EXPECT_EQ(repo->class_info->implements, (std::vector<std::string>{"Repository", "Cache"}));
        EXPECT_TRUE(repo->class_info->has_private_constructor);
        EXPECT_EQ(repo->class_info->line_count, 3u);
    }

    TEST_F(JavaScriptExtractorTest, Interfaces) {
        const auto out = extractor_.extract(kSource, "typescript");

        const auto* repository = find_entity(out, NodeType::Interface, "Repository");
        ASSERT_NE(repository, nullptr);
        EXPECT_EQ(repository->line, 21u);
    }

    TEST_F(JavaScriptExtractorTest, Variables) {
        const auto out = extractor_.extract(kSource, "typescript");

        const auto* lodash = find_entity(out, NodeType::Variable, "lodash");
        ASSERT_NE(lodash, nullptr);
        EXPECT_EQ(lodash->declaration_kind, "const");

        const auto* counter = find_entity(out, NodeType::Variable, "counter");
        ASSERT_NE(counter, nullptr);
        EXPECT_EQ(counter->declaration_kind, "let");
        EXPECT_DOUBLE_EQ(counter->importance, 0.3);
    }

    TEST_F(JavaScriptExtractorTest, EntitiesAreInSourceOrder) {
        const auto out = extractor_.extract(kSource, "typescript");

        EXPECT_TRUE(std::is_sorted(out.entities.begin(), out.entities.end(),
                                   [](const EntityCandidate& a, const EntityCandidate& b) {
                                       return a.name_offset < b.name_offset;
                                   }));
    }

    TEST_F(JavaScriptExtractorTest, Dependencies) {
        const auto out = extractor_.extract(kSource, "typescript");

        ASSERT_EQ(out.dependencies.size(), 3u);
        EXPECT_EQ(out.dependencies[0].specifier, "./utils");
        EXPECT_TRUE(out.dependencies[0].relative);
        EXPECT_EQ(out.dependencies[0].import_type, "import");
        EXPECT_EQ(out.dependencies[1].specifier, "react");
        EXPECT_FALSE(out.dependencies[1].relative);
        EXPECT_EQ(out.dependencies[2].specifier, "lodash");
        EXPECT_EQ(out.dependencies[2].import_type, "require");
        EXPECT_EQ(out.dependencies[2].line, 3u);
    }

    TEST_F(JavaScriptExtractorTest, OtherImportForms) {
        const auto out = extractor_.extract(
            "import './polyfill';\n"
            "const lazy = import('./lazy');\n"
            "export * from './shared';\n",
            "javascript");

        ASSERT_EQ(out.dependencies.size(), 3u);
        EXPECT_EQ(out.dependencies[0].specifier, "./polyfill");
        EXPECT_EQ(out.dependencies[1].specifier, "./lazy");
        EXPECT_EQ(out.dependencies[2].specifier, "./shared");
        EXPECT_EQ(out.dependencies[2].import_type, "export");
    }

    TEST_F(JavaScriptExtractorTest, DuplicateNamesAreCountedAsAmbiguous) {
        const auto out = extractor_.extract(
            "function run() {}\nfunction run() {}\n",
            "javascript");

        EXPECT_EQ(out.entities.size(), 1u);
        EXPECT_EQ(out.ambiguous, 1u);
    }

    TEST_F(JavaScriptExtractorTest, Usages) {
        const auto out = extractor_.extract(kSource, "typescript");
        const auto usages = extract_usages(kSource, out.entities);

        std::vector<std::string> names;
        for (const auto& usage : usages) {
            names.push_back(usage.name);
        }

        EXPECT_NE(std::find(names.begin(), names.end(), "helper"), names.end());
        EXPECT_EQ(std::find(names.begin(), names.end(), "fetchUser"), names.end());
        EXPECT_EQ(std::find(names.begin(), names.end(), "require"), names.end());
        EXPECT_EQ(std::find(names.begin(), names.end(), "if"), names.end());
    }

    TEST_F(JavaScriptExtractorTest, UsageReportedOncePerName) {
        const std::string source = "function a() {}\nb(1);\nb(2);\na();\n";
        const auto out = extractor_.extract(source, "javascript");
        const auto usages = extract_usages(source, out.entities);

        ASSERT_EQ(usages.size(), 2u);
        EXPECT_EQ(usages[0].name, "b");
        EXPECT_EQ(usages[0].line, 2u);
        EXPECT_EQ(usages[1].name, "a");
        EXPECT_EQ(usages[1].line, 4u);
    }

    TEST_F(JavaScriptExtractorTest, UsageScanHandlesVeryLongTokens) {
        const std::string source =
            "const data = \"data:image/png;base64," + std::string(200000, 'A') + "\";\n"
            "render(data);\n";

        const auto usages = extract_usages(source, {});

        ASSERT_EQ(usages.size(), 1u);
        EXPECT_EQ(usages[0].name, "render");
        EXPECT_EQ(usages[0].line, 2u);
    }

    TEST_F(JavaScriptExtractorTest, UsageAllowsWhitespaceBeforeParenthesis) {
        const auto usages = extract_usages("compute (1);\nvalue;\n", {});

        ASSERT_EQ(usages.size(), 1u);
        EXPECT_EQ(usages[0].name, "compute");
    }
}
