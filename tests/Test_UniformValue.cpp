#include <gtest/gtest.h>

#include <limits>

#include "FakeGraphicsDevice.hpp"
#include "prism/render/ShaderProgram.hpp"
#include "prism/render/UniformValue.hpp"

using namespace prism;

namespace
{
    constexpr const char* kVertex = R"(
#version 450 core
in vec3 aPosition;
void main() { gl_Position = vec4(aPosition, 1.0); }
)";

    constexpr const char* kFragment = R"(
#version 450 core
uniform float uFloat;
uniform int uInt;
uniform bool uFlag;
uniform vec3 uVector;
uniform mat4 uMatrix;
uniform sampler2D uTexture;
out vec4 FragColor;
void main() { FragColor = vec4(uFloat); }
)";

    struct Fixture
    {
        tests::FakeGraphicsDevice device;
        render::ShaderProgram program{device, "uniforms", kVertex, kFragment};

        Fixture()
        {
            program.Compile();
            program.Use();
        }

        bool Upload(const char* name, render::UniformType type, const render::UniformValue& value)
        {
            return render::UploadUniform(device, program.UniformLocation(name), type, value);
        }

        const render::UniformValue* Written(const char* name) const { return device.Uniform(program.Handle(), name); }
    };
}

TEST(UniformValue, TypeKeywords)
{
    EXPECT_EQ(render::UniformTypeFromText("float"), render::UniformType::Float);
    EXPECT_EQ(render::UniformTypeFromText("int"), render::UniformType::Int);
    EXPECT_EQ(render::UniformTypeFromText("bool"), render::UniformType::Bool);
    EXPECT_EQ(render::UniformTypeFromText("vec2"), render::UniformType::Vec2);
    EXPECT_EQ(render::UniformTypeFromText("vec3"), render::UniformType::Vec3);
    EXPECT_EQ(render::UniformTypeFromText("vec4"), render::UniformType::Vec4);
    EXPECT_EQ(render::UniformTypeFromText("mat3"), render::UniformType::Mat3);
    EXPECT_EQ(render::UniformTypeFromText("mat4"), render::UniformType::Mat4);
    EXPECT_EQ(render::UniformTypeFromText("sampler2D"), render::UniformType::Sampler2D);
    EXPECT_EQ(render::UniformTypeFromText("dvec3"), render::UniformType::Unknown);
    EXPECT_EQ(render::UniformTypeFromText(""), render::UniformType::Unknown);

    EXPECT_STREQ(render::UniformTypeToText(render::UniformType::Vec4), "vec4");
    EXPECT_STREQ(render::UniformTypeToText(render::UniformType::Sampler2D), "sampler2D");
    EXPECT_STREQ(render::UniformTypeToText(render::UniformType::Unknown), "unknown");
}

TEST(UniformValue, ScalarsConvertBetweenFloatIntAndBool)
{
    Fixture f;

    ASSERT_TRUE(f.Upload("uFloat", render::UniformType::Float, 3));
    EXPECT_FLOAT_EQ(std::get<float>(*f.Written("uFloat")), 3.0F);

    ASSERT_TRUE(f.Upload("uInt", render::UniformType::Int, 2.9F));
    EXPECT_EQ(std::get<int>(*f.Written("uInt")), 2);

    ASSERT_TRUE(f.Upload("uFlag", render::UniformType::Bool, 7));
    EXPECT_EQ(std::get<int>(*f.Written("uFlag")), 1);

    ASSERT_TRUE(f.Upload("uFlag", render::UniformType::Bool, false));
    EXPECT_EQ(std::get<int>(*f.Written("uFlag")), 0);

    ASSERT_TRUE(f.Upload("uFloat", render::UniformType::Float, true));
    EXPECT_FLOAT_EQ(std::get<float>(*f.Written("uFloat")), 1.0F);
}

TEST(UniformValue, FloatsOutsideIntRangeAreRejected)
{
    Fixture f;

    EXPECT_FALSE(f.Upload("uInt", render::UniformType::Int, 3e9F));
    EXPECT_FALSE(f.Upload("uInt", render::UniformType::Int, -3e9F));
    EXPECT_FALSE(f.Upload("uInt", render::UniformType::Int, std::numeric_limits<float>::quiet_NaN()));
    EXPECT_FALSE(f.Upload("uFlag", render::UniformType::Bool, std::numeric_limits<float>::infinity()));
    EXPECT_EQ(f.device.UniformWriteCount("uInt"), 0);
    EXPECT_EQ(f.device.UniformWriteCount("uFlag"), 0);

    ASSERT_TRUE(f.Upload("uInt", render::UniformType::Int, -2147483648.0F));
    EXPECT_EQ(std::get<int>(*f.Written("uInt")), std::numeric_limits<int>::min());
    ASSERT_TRUE(f.Upload("uInt", render::UniformType::Int, -7.5F));
    EXPECT_EQ(std::get<int>(*f.Written("uInt")), -7);
}

TEST(UniformValue, VectorsAndMatricesMustMatchExactly)
{
    Fixture f;

    EXPECT_TRUE(f.Upload("uVector", render::UniformType::Vec3, glm::vec3(1.0F, 2.0F, 3.0F)));
    EXPECT_EQ(std::get<glm::vec3>(*f.Written("uVector")), glm::vec3(1.0F, 2.0F, 3.0F));

    EXPECT_FALSE(f.Upload("uVector", render::UniformType::Vec3, glm::vec4(1.0F)));
    EXPECT_FALSE(f.Upload("uVector", render::UniformType::Vec3, 1.0F));
    EXPECT_FALSE(f.Upload("uMatrix", render::UniformType::Mat4, glm::mat3(1.0F)));
    EXPECT_TRUE(f.Upload("uMatrix", render::UniformType::Mat4, glm::mat4(1.0F)));

    // Mismatches leave the previous value in place.
    EXPECT_EQ(f.device.UniformWriteCount("uVector"), 1);
}

TEST(UniformValue, EmptyValueUploadsNothing)
{
    Fixture f;
    EXPECT_FALSE(f.Upload("uFloat", render::UniformType::Float, render::UniformValue{}));
    EXPECT_EQ(f.Written("uFloat"), nullptr);
}

TEST(UniformValue, SamplerAndUnknownTypesAreSkipped)
{
    Fixture f;
    EXPECT_FALSE(f.Upload("uTexture", render::UniformType::Sampler2D, 0));
    EXPECT_FALSE(f.Upload("uFloat", render::UniformType::Unknown, 1.0F));
    EXPECT_EQ(f.device.UniformWriteCount("uTexture"), 0);
    EXPECT_EQ(f.device.UniformWriteCount("uFloat"), 0);
}

TEST(UniformValue, NegativeLocationIsRejected)
{
    Fixture f;
    EXPECT_FALSE(render::UploadUniform(f.device, -1, render::UniformType::Float, 1.0F));
    EXPECT_FALSE(f.Upload("uAbsent", render::UniformType::Float, 1.0F));
}
