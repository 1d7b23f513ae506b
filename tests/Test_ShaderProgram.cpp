#include <gtest/gtest.h>

#include <string>

#include "FakeGraphicsDevice.hpp"
#include "prism/render/BuiltinPrograms.hpp"
#include "prism/render/ShaderProgram.hpp"

using namespace prism;

namespace
{
    constexpr const char* kVertex = R"(
#version 450 core
in vec3 aPosition;
in vec3 aNormal;
uniform mat4 uModelMatrix;
uniform mat4 uViewProjectionMatrix;
void main() { gl_Position = uViewProjectionMatrix * uModelMatrix * vec4(aPosition + aNormal * 0.0, 1.0); }
)";

    constexpr const char* kFragment = R"(
#version 450 core
uniform vec3 uBaseColor;
uniform vec3 uLightColors[8];
out vec4 FragColor;
void main() { FragColor = vec4(uBaseColor + uLightColors[0], 1.0); }
)";
}

TEST(ShaderProgram, CompileResolvesUniformsAndAttributes)
{
    tests::FakeGraphicsDevice device;
    render::ShaderProgram program(device, "test", kVertex, kFragment);
    EXPECT_FALSE(program.IsReady());

    program.Compile();
    ASSERT_TRUE(program.IsReady());
    EXPECT_EQ(program.Name(), "test");

    EXPECT_GE(program.UniformLocation("uModelMatrix"), 0);
    EXPECT_GE(program.UniformLocation("uBaseColor"), 0);
    EXPECT_GE(program.UniformLocation("uLightColors"), 0); // array suffix stripped
    EXPECT_EQ(program.UniformLocation("uMissing"), -1);
    EXPECT_EQ(program.Uniforms().size(), 4u);

    EXPECT_EQ(program.AttribLocation("aPosition"), 0);
    EXPECT_EQ(program.AttribLocation("aNormal"), 1);
    EXPECT_EQ(program.AttribLocation("aTexCoord"), -1);
}

TEST(ShaderProgram, VertexCompileFailureThrowsWithLog)
{
    tests::FakeGraphicsDevice device;
    device.failCompileContaining = "aNormal";
    render::ShaderProgram program(device, "broken", kVertex, kFragment);

    try
    {
        program.Compile();
        FAIL() << "expected GraphicsError";
    }
    catch (const render::GraphicsError& error)
    {
        const std::string message = error.what();
        EXPECT_NE(message.find("'broken'"), std::string::npos);
        EXPECT_NE(message.find("vertex shader compile error"), std::string::npos);
        EXPECT_NE(message.find("injected compile failure"), std::string::npos);
    }
    EXPECT_FALSE(program.IsReady());
}

TEST(ShaderProgram, FragmentCompileFailureThrows)
{
    tests::FakeGraphicsDevice device;
    device.failCompileContaining = "FragColor";
    render::ShaderProgram program(device, "broken", kVertex, kFragment);

    EXPECT_THROW(program.Compile(), render::GraphicsError);
    EXPECT_FALSE(program.IsReady());
}

TEST(ShaderProgram, LinkFailureThrowsWithLog)
{
    tests::FakeGraphicsDevice device;
    device.failLinkContaining = "uBaseColor";
    render::ShaderProgram program(device, "unlinked", kVertex, kFragment);

    try
    {
        program.Compile();
        FAIL() << "expected GraphicsError";
    }
    catch (const render::GraphicsError& error)
    {
        const std::string message = error.what();
        EXPECT_NE(message.find("program link error"), std::string::npos);
        EXPECT_NE(message.find("injected link failure"), std::string::npos);
    }
    EXPECT_FALSE(program.IsReady());
}

TEST(ShaderProgram, DisposeIsIdempotent)
{
    tests::FakeGraphicsDevice device;
    render::ShaderProgram program(device, "test", kVertex, kFragment);
    program.Compile();
    EXPECT_EQ(device.LivePrograms(), 1u);

    program.Dispose();
    program.Dispose();
    EXPECT_FALSE(program.IsReady());
    EXPECT_EQ(device.LivePrograms(), 0u);
    EXPECT_EQ(program.UniformLocation("uModelMatrix"), -1);
    EXPECT_EQ(program.AttribLocation("aPosition"), -1);

    // Use on a disposed program touches nothing.
    program.Use();
    EXPECT_TRUE(device.programBinds.empty());
}

TEST(ShaderProgram, RecompileReplacesHandle)
{
    tests::FakeGraphicsDevice device;
    render::ShaderProgram program(device, "test", kVertex, kFragment);
    program.Compile();
    const render::GpuHandle first = program.Handle();

    program.Compile();
    EXPECT_NE(program.Handle(), first);
    EXPECT_EQ(device.LivePrograms(), 1u);
}

TEST(ShaderProgram, NamedSettersSkipMissingUniforms)
{
    tests::FakeGraphicsDevice device;
    render::ShaderProgram program(device, "test", kVertex, kFragment);
    program.Compile();
    program.Use();

    program.SetVec3("uBaseColor", glm::vec3(1.0F, 0.0F, 0.0F));
    program.SetVec3("uNotThere", glm::vec3(1.0F));
    program.SetMat4("uModelMatrix", glm::mat4(2.0F));

    const render::UniformValue* color = device.Uniform(program.Handle(), "uBaseColor");
    ASSERT_NE(color, nullptr);
    EXPECT_EQ(std::get<glm::vec3>(*color), glm::vec3(1.0F, 0.0F, 0.0F));
    EXPECT_NE(device.Uniform(program.Handle(), "uModelMatrix"), nullptr);
    EXPECT_EQ(device.UniformWriteCount("uNotThere"), 0);
}

TEST(BuiltinPrograms, NamesAndSources)
{
    EXPECT_STREQ(render::BuiltinProgramName(render::BuiltinProgram::Default), "default");
    EXPECT_STREQ(render::BuiltinProgramName(render::BuiltinProgram::Pbr), "pbr");
    EXPECT_STREQ(render::BuiltinProgramName(render::BuiltinProgram::Line), "line");

    tests::FakeGraphicsDevice device;
    for (const auto kind : {render::BuiltinProgram::Default, render::BuiltinProgram::Pbr})
    {
        auto program = render::CreateBuiltinProgram(device, kind);
        ASSERT_NE(program, nullptr);
        EXPECT_FALSE(program->IsReady());
        program->Compile();
    }

    // Both mesh fragment shaders size their light arrays to eight.
    int lightLoops = 0;
    for (const std::string& source : device.compiledSources)
    {
        if (source.find("#define MAX_LIGHTS 8") != std::string::npos)
        {
            ++lightLoops;
            EXPECT_NE(source.find("uLightCount"), std::string::npos);
        }
    }
    EXPECT_EQ(lightLoops, 2);
}

TEST(BuiltinPrograms, MeshProgramsExposeCommonUniforms)
{
    tests::FakeGraphicsDevice device;
    auto pbr = render::CreateBuiltinProgram(device, render::BuiltinProgram::Pbr);
    pbr->Compile();

    for (const char* name : render::uniforms::kCommon)
    {
        EXPECT_GE(pbr->UniformLocation(name), 0) << name;
    }
    EXPECT_GE(pbr->UniformLocation(render::uniforms::kMetallic), 0);
    EXPECT_GE(pbr->UniformLocation(render::uniforms::kRoughness), 0);
    EXPECT_GE(pbr->UniformLocation(render::uniforms::kEmissionStrength), 0);

    auto line = render::CreateBuiltinProgram(device, render::BuiltinProgram::Line);
    line->Compile();
    EXPECT_GE(line->UniformLocation(render::uniforms::kModelViewProjection), 0);
    EXPECT_GE(line->UniformLocation(render::uniforms::kColor), 0);
    EXPECT_EQ(line->AttribLocation("aNormal"), -1);
}
