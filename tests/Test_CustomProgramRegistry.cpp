#include <gtest/gtest.h>

#include <string>

#include "FakeGraphicsDevice.hpp"
#include "prism/render/CustomProgramRegistry.hpp"
#include "prism/render/MaterialLibrary.hpp"

using namespace prism;

namespace
{
    constexpr const char* kVertex = R"(
#version 450 core
in vec3 aPosition;
uniform mat4 uModelMatrix;
uniform mat4 uViewProjectionMatrix;
void main() { gl_Position = uViewProjectionMatrix * uModelMatrix * vec4(aPosition, 1.0); }
)";

    constexpr const char* kFragment = R"(
#version 450 core
uniform float uGlow;
uniform vec3 uAmbientColor;
uniform float uUndeclared;
out vec4 FragColor;
void main() { FragColor = vec4(uAmbientColor * uGlow + uUndeclared, 1.0); }
)";

    constexpr const char* kBrokenFragment = R"(
#version 450 core
BROKEN
)";

    std::vector<render::UniformDeclaration> GlowDeclarations()
    {
        render::UniformDeclaration glow;
        glow.name = "uGlow";
        glow.type = render::UniformType::Float;
        glow.defaultValue = 1.5F;

        render::UniformDeclaration missing;
        missing.name = "uNotInShader";
        missing.type = render::UniformType::Vec3;
        missing.defaultValue = glm::vec3(1.0F);
        return {glow, missing};
    }
}

TEST(CustomProgramRegistry, CompileResolvesDeclaredAndCommonUniforms)
{
    tests::FakeGraphicsDevice device;
    render::CustomProgramRegistry registry(device);

    std::string error = "untouched";
    ASSERT_TRUE(registry.Compile("glow", kVertex, kFragment, GlowDeclarations(), &error));
    EXPECT_EQ(error, "untouched");
    EXPECT_TRUE(registry.Has("glow"));
    EXPECT_EQ(registry.Size(), 1u);
    EXPECT_TRUE(registry.LastError("glow").empty());

    const render::ShaderProgram* program = registry.FindProgram("glow");
    ASSERT_NE(program, nullptr);
    EXPECT_EQ(program->Name(), "custom:glow");

    const render::UniformLocationMap* locations = registry.FindUniformLocations("glow");
    ASSERT_NE(locations, nullptr);
    EXPECT_TRUE(locations->contains("uGlow"));
    EXPECT_TRUE(locations->contains("uModelMatrix"));
    EXPECT_TRUE(locations->contains("uViewProjectionMatrix"));
    EXPECT_TRUE(locations->contains("uAmbientColor"));
    // Inactive declarations and undeclared uniforms are not mapped.
    EXPECT_FALSE(locations->contains("uNotInShader"));
    EXPECT_FALSE(locations->contains("uUndeclared"));
    EXPECT_FALSE(locations->contains("uLightCount"));
}

TEST(CustomProgramRegistry, FailedCompileKeepsPreviousProgram)
{
    tests::FakeGraphicsDevice device;
    render::CustomProgramRegistry registry(device);
    ASSERT_TRUE(registry.Compile("glow", kVertex, kFragment, GlowDeclarations()));
    const render::GpuHandle working = registry.FindProgram("glow")->Handle();

    device.failCompileContaining = "BROKEN";
    std::string error;
    EXPECT_FALSE(registry.Compile("glow", kVertex, kBrokenFragment, GlowDeclarations(), &error));
    EXPECT_NE(error.find("fragment shader compile error"), std::string::npos);
    EXPECT_EQ(registry.LastError("glow"), error);

    ASSERT_NE(registry.FindProgram("glow"), nullptr);
    EXPECT_EQ(registry.FindProgram("glow")->Handle(), working);
    EXPECT_EQ(device.LivePrograms(), 1u);

    // A later successful build clears the error.
    device.failCompileContaining.clear();
    ASSERT_TRUE(registry.Compile("glow", kVertex, kFragment, GlowDeclarations()));
    EXPECT_TRUE(registry.LastError("glow").empty());
    EXPECT_NE(registry.FindProgram("glow")->Handle(), working);
    EXPECT_EQ(device.LivePrograms(), 1u);
}

TEST(CustomProgramRegistry, FirstCompileFailureLeavesNoProgram)
{
    tests::FakeGraphicsDevice device;
    device.failLinkContaining = "uGlow";
    render::CustomProgramRegistry registry(device);

    EXPECT_FALSE(registry.Compile("glow", kVertex, kFragment, GlowDeclarations()));
    EXPECT_FALSE(registry.Has("glow"));
    EXPECT_EQ(registry.Size(), 0u);
    EXPECT_EQ(registry.FindProgram("glow"), nullptr);
    EXPECT_EQ(registry.FindUniformLocations("glow"), nullptr);
    EXPECT_NE(registry.LastError("glow").find("link error"), std::string::npos);
}

TEST(CustomProgramRegistry, RemoveAndClearReleasePrograms)
{
    tests::FakeGraphicsDevice device;
    render::CustomProgramRegistry registry(device);
    ASSERT_TRUE(registry.Compile("a", kVertex, kFragment, {}));
    ASSERT_TRUE(registry.Compile("b", kVertex, kFragment, {}));
    EXPECT_EQ(registry.Size(), 2u);

    registry.Remove("a");
    EXPECT_FALSE(registry.Has("a"));
    EXPECT_EQ(device.LivePrograms(), 1u);
    registry.Remove("missing");

    registry.Clear();
    EXPECT_EQ(registry.Size(), 0u);
    EXPECT_EQ(device.LivePrograms(), 0u);
}

TEST(MaterialLibrary, AddFindAndSetParameter)
{
    render::MaterialLibrary library;
    render::MaterialAsset asset;
    asset.shaderId = "glow";
    asset.uniforms = GlowDeclarations();
    library.Add("glow-material", asset);

    const render::MaterialAsset* found = library.FindMaterial("glow-material");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->shaderId, "glow");
    EXPECT_EQ(library.FindMaterial("other"), nullptr);

    EXPECT_TRUE(library.SetParameter("glow-material", "uGlow", 4.0F));
    EXPECT_FLOAT_EQ(std::get<float>(found->parameters.at("uGlow")), 4.0F);
    EXPECT_FALSE(library.SetParameter("other", "uGlow", 4.0F));

    library.Remove("glow-material");
    EXPECT_EQ(library.Size(), 0u);
}
