#include <gtest/gtest.h>

#include "codegen/export_manifest.hpp"
#include "codegen/loader.hpp"
#include "codegen/options.hpp"
#include "codegen/template.hpp"
#include "frontend/module.hpp"

#include <string>

using namespace modsync;

TEST(Template, RenderSubstitutesPlaceholders)
{
    codegen::Template skeleton{"Hello {{name}}, {{ greeting }}!\n{{name}}"};
    auto rendered = skeleton.render({{"name", "World"}, {"greeting", "welcome"}});
    ASSERT_TRUE(rendered) << rendered.error();
    EXPECT_EQ(rendered.value(), "Hello World, welcome!\nWorld");
}

TEST(Template, RenderWithoutPlaceholders)
{
    codegen::Template skeleton{"plain text { not a placeholder }"};
    auto rendered = skeleton.render({});
    ASSERT_TRUE(rendered) << rendered.error();
    EXPECT_EQ(rendered.value(), "plain text { not a placeholder }");
}

TEST(Template, UnknownPlaceholderIsAnError)
{
    codegen::Template skeleton{"line one\n{{known}} {{typo}}\n"};
    auto rendered = skeleton.render({{"known", "x"}});
    ASSERT_FALSE(rendered);
    EXPECT_EQ(rendered.error(), "Unknown placeholder '{{typo}}' at line 2");
}

TEST(Template, UnterminatedPlaceholderIsAnError)
{
    codegen::Template skeleton{"a\nb\n{{name"};
    auto rendered = skeleton.render({{"name", "x"}});
    ASSERT_FALSE(rendered);
    EXPECT_EQ(rendered.error(), "Unterminated placeholder at line 3");

    auto names = skeleton.placeholders();
    EXPECT_FALSE(names);
}

TEST(Template, Placeholders)
{
    codegen::Template skeleton{"{{b}} {{a}} {{ b }}"};
    auto names = skeleton.placeholders();
    ASSERT_TRUE(names) << names.error();
    ASSERT_EQ(names->size(), 2);
    EXPECT_EQ(names->at(0), "b");
    EXPECT_EQ(names->at(1), "a");
}

TEST(Loader, QuoteEscapesSingleQuotes)
{
    EXPECT_EQ(codegen::quote("gcl"), "'gcl'");
    EXPECT_EQ(codegen::quote("it's"), "'it''s'");
    EXPECT_EQ(codegen::quote(""), "''");
}

TEST(Loader, RenderArray)
{
    EXPECT_EQ(codegen::render_array({}), "@()");
    EXPECT_EQ(codegen::render_array({"A"}), "@(\n    'A'\n)");
    EXPECT_EQ(codegen::render_array({"A", "B"}), "@(\n    'A'\n    'B'\n)");
}

TEST(Loader, DefaultTemplateUsesKnownPlaceholders)
{
    codegen::Template skeleton{std::string(codegen::default_loader_template())};
    auto names = skeleton.placeholders();
    ASSERT_TRUE(names) << names.error();

    auto module = frontend::make_module_descriptor("/modules", "Sample");
    auto bindings = codegen::loader_bindings(module, {}, {});
    for (const auto& name : names.value()) {
        EXPECT_TRUE(bindings.contains(name)) << "unbound placeholder " << name;
    }
}

TEST(Loader, RenderDefaultLoader)
{
    auto module = frontend::make_module_descriptor("/modules", "Sample");
    codegen::ExportManifest manifest;
    manifest.functions = {"Get-A", "Get-B"};
    manifest.aliases = {"ga"};

    codegen::Template skeleton{std::string(codegen::default_loader_template())};
    auto rendered = codegen::render_loader(skeleton, module, manifest, {});
    ASSERT_TRUE(rendered) << rendered.error();

    const auto& text = rendered.value();
    EXPECT_TRUE(text.starts_with("# Sample.psm1\n"));
    EXPECT_NE(text.find("Join-Path $PSScriptRoot 'Private') -Filter '*.ps1'"), std::string::npos);
    EXPECT_NE(text.find("Join-Path $PSScriptRoot 'Public') -Filter '*.ps1'"), std::string::npos);
    EXPECT_NE(text.find("$FunctionsToExport = @(\n    'Get-A'\n    'Get-B'\n)"), std::string::npos);
    EXPECT_NE(text.find("$AliasesToExport = @(\n    'ga'\n)"), std::string::npos);
    EXPECT_NE(text.find("Export-ModuleMember -Function $FunctionsToExport -Alias $AliasesToExport"),
              std::string::npos);

    // private files are loaded before public ones
    EXPECT_LT(text.find("$privateFiles ="), text.find("$publicFiles ="));
}

TEST(Loader, RenderLoaderWithEmptyManifest)
{
    auto module = frontend::make_module_descriptor("/modules", "Empty");
    codegen::Template skeleton{std::string(codegen::default_loader_template())};
    auto rendered = codegen::render_loader(skeleton, module, {}, {});
    ASSERT_TRUE(rendered) << rendered.error();
    EXPECT_NE(rendered->find("$FunctionsToExport = @()"), std::string::npos);
    EXPECT_NE(rendered->find("$AliasesToExport = @()"), std::string::npos);
}

TEST(Loader, RenderCustomLayout)
{
    auto module = frontend::make_module_descriptor("/modules", "Sample");
    codegen::GenerationOptions options;
    options.layout.public_dir = "Exported";
    options.layout.private_dir = "Internal";
    options.scan.extension = ".psx";

    codegen::Template skeleton{"{{module_name}}|{{public_dir}}|{{private_dir}}|{{extension}}"};
    auto rendered = codegen::render_loader(skeleton, module, {}, options);
    ASSERT_TRUE(rendered) << rendered.error();
    EXPECT_EQ(rendered.value(), "Sample|Exported|Internal|.psx");
}
