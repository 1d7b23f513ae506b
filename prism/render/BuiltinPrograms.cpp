#include "prism/render/BuiltinPrograms.hpp"

namespace prism::render
{
namespace
{
constexpr const char* kMeshVertexShader = R"(
#version 450 core
in vec3 aPosition;
in vec3 aNormal;
in vec2 aTexCoord;

uniform mat4 uModelMatrix;
uniform mat4 uViewProjectionMatrix;
uniform mat3 uNormalMatrix;

out vec3 vNormal;
out vec3 vWorldPosition;
out vec2 vTexCoord;

void main()
{
    vec4 worldPosition = uModelMatrix * vec4(aPosition, 1.0);
    vWorldPosition = worldPosition.xyz;
    vNormal = normalize(uNormalMatrix * aNormal);
    vTexCoord = aTexCoord;
    gl_Position = uViewProjectionMatrix * worldPosition;
}
)";

constexpr const char* kDefaultFragmentShader = R"(
#version 450 core
#define MAX_LIGHTS 8

in vec3 vNormal;
in vec3 vWorldPosition;
in vec2 vTexCoord;

uniform vec3 uBaseColor;
uniform vec3 uCameraPosition;
uniform vec3 uLightDirections[MAX_LIGHTS];
uniform vec3 uLightColors[MAX_LIGHTS];
uniform int uLightCount;
uniform vec3 uAmbientColor;

out vec4 FragColor;

void main()
{
    vec3 normal = normalize(vNormal);
    vec3 viewDir = normalize(uCameraPosition - vWorldPosition);

    vec3 diffuse = vec3(0.0);
    for (int i = 0; i < MAX_LIGHTS; ++i)
    {
        if (i >= uLightCount)
        {
            break;
        }
        float NdotL = max(dot(normal, -uLightDirections[i]), 0.0);
        diffuse += uBaseColor * uLightColors[i] * NdotL;
    }

    // Z-up hemisphere: ground receives 60% of the sky ambient.
    float hemiFactor = normal.z * 0.5 + 0.5;
    vec3 ambient = uBaseColor * mix(uAmbientColor * 0.6, uAmbientColor, hemiFactor);

    vec3 rim = vec3(0.0);
    if (uLightCount > 0)
    {
        float rimFactor = pow(1.0 - max(dot(viewDir, normal), 0.0), 3.0);
        rim = rimFactor * 0.15 * uLightColors[0];
    }

    vec3 color = diffuse + ambient + rim;
    FragColor = vec4(pow(color, vec3(1.0 / 2.2)), 1.0);
}
)";

constexpr const char* kPbrFragmentShader = R"(
#version 450 core
#define MAX_LIGHTS 8

const float PI = 3.14159265359;
const float INV_PI = 0.31830988618;

in vec3 vNormal;
in vec3 vWorldPosition;
in vec2 vTexCoord;

uniform vec3 uBaseColor;
uniform float uMetallic;
uniform float uRoughness;
uniform vec3 uEmission;
uniform float uEmissionStrength;

uniform vec3 uCameraPosition;
uniform vec3 uLightDirections[MAX_LIGHTS];
uniform vec3 uLightColors[MAX_LIGHTS];
uniform int uLightCount;
uniform vec3 uAmbientColor;

out vec4 FragColor;

float distributionGGX(float NdotH, float roughness)
{
    float a = roughness * roughness;
    float a2 = a * a;
    float NdotH2 = NdotH * NdotH;
    float denom = NdotH2 * (a2 - 1.0) + 1.0;
    denom = PI * denom * denom;
    return a2 / max(denom, 0.0001);
}

float geometrySchlickGGX(float NdotX, float roughness)
{
    float r = roughness + 1.0;
    float k = (r * r) / 8.0;
    return NdotX / (NdotX * (1.0 - k) + k);
}

float geometrySmith(float NdotV, float NdotL, float roughness)
{
    return geometrySchlickGGX(NdotV, roughness) * geometrySchlickGGX(NdotL, roughness);
}

vec3 fresnelSchlick(float cosTheta, vec3 F0)
{
    return F0 + (1.0 - F0) * pow(clamp(1.0 - cosTheta, 0.0, 1.0), 5.0);
}

vec3 fresnelSchlickRoughness(float cosTheta, vec3 F0, float roughness)
{
    return F0 + (max(vec3(1.0 - roughness), F0) - F0) * pow(clamp(1.0 - cosTheta, 0.0, 1.0), 5.0);
}

vec3 calculateF0(vec3 albedo, float metallic)
{
    return mix(vec3(0.04), albedo, metallic);
}

vec3 cookTorranceSpecular(float NdotL, float NdotV, float NdotH, float HdotV, vec3 F0, float roughness, out vec3 F)
{
    float D = distributionGGX(NdotH, roughness);
    float G = geometrySmith(NdotV, NdotL, roughness);
    F = fresnelSchlick(HdotV, F0);
    return (D * G * F) / (4.0 * max(NdotV, 0.001) * max(NdotL, 0.001));
}

vec3 lambertianDiffuse(vec3 albedo)
{
    return albedo * INV_PI;
}

vec3 tonemapACES(vec3 x)
{
    const float a = 2.51;
    const float b = 0.03;
    const float c = 2.43;
    const float d = 0.59;
    const float e = 0.14;
    return clamp((x * (a * x + b)) / (x * (c * x + d) + e), 0.0, 1.0);
}

vec3 linearToSRGB(vec3 color)
{
    return pow(color, vec3(1.0 / 2.2));
}

vec3 hemisphereAmbient(vec3 N, vec3 skyColor, vec3 groundColor)
{
    float factor = N.z * 0.5 + 0.5;
    return mix(groundColor, skyColor, factor);
}

void main()
{
    vec3 N = normalize(vNormal);
    vec3 V = normalize(uCameraPosition - vWorldPosition);

    vec3 albedo = uBaseColor;
    float metallic = clamp(uMetallic, 0.0, 1.0);
    float roughness = max(uRoughness, 0.04);
    vec3 F0 = calculateF0(albedo, metallic);
    float NdotV = max(dot(N, V), 0.0);

    vec3 Lo = vec3(0.0);
    for (int i = 0; i < MAX_LIGHTS; ++i)
    {
        if (i >= uLightCount)
        {
            break;
        }

        vec3 L = normalize(-uLightDirections[i]);
        float NdotL = dot(N, L);
        if (NdotL <= 0.0)
        {
            continue;
        }

        vec3 H = normalize(V + L);
        float NdotH = max(dot(N, H), 0.0);
        float HdotV = max(dot(H, V), 0.0);

        vec3 F;
        vec3 specular = cookTorranceSpecular(NdotL, NdotV, NdotH, HdotV, F0, roughness, F);
        vec3 kD = (vec3(1.0) - F) * (1.0 - metallic);
        Lo += (kD * lambertianDiffuse(albedo) + specular) * uLightColors[i] * NdotL;
    }

    vec3 F_ambient = fresnelSchlickRoughness(NdotV, F0, roughness);
    vec3 kD_ambient = (vec3(1.0) - F_ambient) * (1.0 - metallic);
    vec3 ambient = hemisphereAmbient(N, uAmbientColor, uAmbientColor * 0.5) * albedo * kD_ambient;
    ambient += F_ambient * uAmbientColor * 0.3 * metallic;

    vec3 color = Lo + ambient + uEmission * uEmissionStrength;
    color = tonemapACES(color);
    FragColor = vec4(linearToSRGB(color), 1.0);
}
)";

constexpr const char* kLineVertexShader = R"(
#version 450 core
in vec3 aPosition;

uniform mat4 uModelViewProjection;

void main()
{
    gl_Position = uModelViewProjection * vec4(aPosition, 1.0);
}
)";

constexpr const char* kLineFragmentShader = R"(
#version 450 core
uniform vec3 uColor;

out vec4 FragColor;

void main()
{
    FragColor = vec4(uColor, 1.0);
}
)";
} // namespace

const char* BuiltinProgramName(BuiltinProgram program)
{
    switch (program)
    {
        case BuiltinProgram::Default: return "default";
        case BuiltinProgram::Pbr: return "pbr";
        case BuiltinProgram::Line: return "line";
    }
    return "unknown";
}

std::unique_ptr<ShaderProgram> CreateBuiltinProgram(IGraphicsDevice& device, BuiltinProgram program)
{
    switch (program)
    {
        case BuiltinProgram::Default:
            return std::make_unique<ShaderProgram>(device, BuiltinProgramName(program), kMeshVertexShader, kDefaultFragmentShader);
        case BuiltinProgram::Pbr:
            return std::make_unique<ShaderProgram>(device, BuiltinProgramName(program), kMeshVertexShader, kPbrFragmentShader);
        case BuiltinProgram::Line:
            return std::make_unique<ShaderProgram>(device, BuiltinProgramName(program), kLineVertexShader, kLineFragmentShader);
    }
    return nullptr;
}
} // namespace prism::render
