// Glint - Display
// Fullscreen blit plus a batched 8x8 bitmap font

#include <glint/display.h>
#include <glint/effects/gpu_common.h>
#include <glint/effects/pipeline_builder.h>
#include <iostream>
#include <vector>

namespace glint {

namespace gpu = effects::gpu;

namespace {

// Embedded 8x8 bitmap font (ASCII 32-127, 96 characters)
// Each character is 8 bytes (8 rows of 8 bits)
const uint8_t FONT_DATA[] = {
    // Space (32)
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    // ! (33)
    0x18, 0x18, 0x18, 0x18, 0x18, 0x00, 0x18, 0x00,
    // " (34)
    0x6C, 0x6C, 0x24, 0x00, 0x00, 0x00, 0x00, 0x00,
    // # (35)
    0x6C, 0x6C, 0xFE, 0x6C, 0xFE, 0x6C, 0x6C, 0x00,
    // $ (36)
    0x18, 0x3E, 0x60, 0x3C, 0x06, 0x7C, 0x18, 0x00,
    // % (37)
    0x00, 0xC6, 0xCC, 0x18, 0x30, 0x66, 0xC6, 0x00,
    // & (38)
    0x38, 0x6C, 0x38, 0x76, 0xDC, 0xCC, 0x76, 0x00,
    // ' (39)
    0x18, 0x18, 0x30, 0x00, 0x00, 0x00, 0x00, 0x00,
    // ( (40)
    0x0C, 0x18, 0x30, 0x30, 0x30, 0x18, 0x0C, 0x00,
    // ) (41)
    0x30, 0x18, 0x0C, 0x0C, 0x0C, 0x18, 0x30, 0x00,
    // * (42)
    0x00, 0x66, 0x3C, 0xFF, 0x3C, 0x66, 0x00, 0x00,
    // + (43)
    0x00, 0x18, 0x18, 0x7E, 0x18, 0x18, 0x00, 0x00,
    // , (44)
    0x00, 0x00, 0x00, 0x00, 0x00, 0x18, 0x18, 0x30,
    // - (45)
    0x00, 0x00, 0x00, 0x7E, 0x00, 0x00, 0x00, 0x00,
    // . (46)
    0x00, 0x00, 0x00, 0x00, 0x00, 0x18, 0x18, 0x00,
    // / (47)
    0x06, 0x0C, 0x18, 0x30, 0x60, 0xC0, 0x80, 0x00,
    // 0 (48)
    0x7C, 0xC6, 0xCE, 0xD6, 0xE6, 0xC6, 0x7C, 0x00,
    // 1 (49)
    0x18, 0x38, 0x18, 0x18, 0x18, 0x18, 0x7E, 0x00,
    // 2 (50)
    0x7C, 0xC6, 0x06, 0x1C, 0x30, 0x66, 0xFE, 0x00,
    // 3 (51)
    0x7C, 0xC6, 0x06, 0x3C, 0x06, 0xC6, 0x7C, 0x00,
    // 4 (52)
    0x1C, 0x3C, 0x6C, 0xCC, 0xFE, 0x0C, 0x1E, 0x00,
    // 5 (53)
    0xFE, 0xC0, 0xFC, 0x06, 0x06, 0xC6, 0x7C, 0x00,
    // 6 (54)
    0x38, 0x60, 0xC0, 0xFC, 0xC6, 0xC6, 0x7C, 0x00,
    // 7 (55)
    0xFE, 0xC6, 0x0C, 0x18, 0x30, 0x30, 0x30, 0x00,
    // 8 (56)
    0x7C, 0xC6, 0xC6, 0x7C, 0xC6, 0xC6, 0x7C, 0x00,
    // 9 (57)
    0x7C, 0xC6, 0xC6, 0x7E, 0x06, 0x0C, 0x78, 0x00,
    // : (58)
    0x00, 0x18, 0x18, 0x00, 0x00, 0x18, 0x18, 0x00,
    // ; (59)
    0x00, 0x18, 0x18, 0x00, 0x00, 0x18, 0x18, 0x30,
    // < (60)
    0x06, 0x0C, 0x18, 0x30, 0x18, 0x0C, 0x06, 0x00,
    // = (61)
    0x00, 0x00, 0x7E, 0x00, 0x00, 0x7E, 0x00, 0x00,
    // > (62)
    0x60, 0x30, 0x18, 0x0C, 0x18, 0x30, 0x60, 0x00,
    // ? (63)
    0x7C, 0xC6, 0x0C, 0x18, 0x18, 0x00, 0x18, 0x00,
    // @ (64)
    0x7C, 0xC6, 0xDE, 0xDE, 0xDE, 0xC0, 0x78, 0x00,
    // A (65)
    0x38, 0x6C, 0xC6, 0xFE, 0xC6, 0xC6, 0xC6, 0x00,
    // B (66)
    0xFC, 0x66, 0x66, 0x7C, 0x66, 0x66, 0xFC, 0x00,
    // C (67)
    0x3C, 0x66, 0xC0, 0xC0, 0xC0, 0x66, 0x3C, 0x00,
    // D (68)
    0xF8, 0x6C, 0x66, 0x66, 0x66, 0x6C, 0xF8, 0x00,
    // E (69)
    0xFE, 0x62, 0x68, 0x78, 0x68, 0x62, 0xFE, 0x00,
    // F (70)
    0xFE, 0x62, 0x68, 0x78, 0x68, 0x60, 0xF0, 0x00,
    // G (71)
    0x3C, 0x66, 0xC0, 0xC0, 0xCE, 0x66, 0x3A, 0x00,
    // H (72)
    0xC6, 0xC6, 0xC6, 0xFE, 0xC6, 0xC6, 0xC6, 0x00,
    // I (73)
    0x3C, 0x18, 0x18, 0x18, 0x18, 0x18, 0x3C, 0x00,
    // J (74)
    0x1E, 0x0C, 0x0C, 0x0C, 0xCC, 0xCC, 0x78, 0x00,
    // K (75)
    0xE6, 0x66, 0x6C, 0x78, 0x6C, 0x66, 0xE6, 0x00,
    // L (76)
    0xF0, 0x60, 0x60, 0x60, 0x62, 0x66, 0xFE, 0x00,
    // M (77)
    0xC6, 0xEE, 0xFE, 0xFE, 0xD6, 0xC6, 0xC6, 0x00,
    // N (78)
    0xC6, 0xE6, 0xF6, 0xDE, 0xCE, 0xC6, 0xC6, 0x00,
    // O (79)
    0x7C, 0xC6, 0xC6, 0xC6, 0xC6, 0xC6, 0x7C, 0x00,
    // P (80)
    0xFC, 0x66, 0x66, 0x7C, 0x60, 0x60, 0xF0, 0x00,
    // Q (81)
    0x7C, 0xC6, 0xC6, 0xC6, 0xD6, 0x7C, 0x0E, 0x00,
    // R (82)
    0xFC, 0x66, 0x66, 0x7C, 0x6C, 0x66, 0xE6, 0x00,
    // S (83)
    0x7C, 0xC6, 0x60, 0x38, 0x0C, 0xC6, 0x7C, 0x00,
    // T (84)
    0x7E, 0x7E, 0x5A, 0x18, 0x18, 0x18, 0x3C, 0x00,
    // U (85)
    0xC6, 0xC6, 0xC6, 0xC6, 0xC6, 0xC6, 0x7C, 0x00,
    // V (86)
    0xC6, 0xC6, 0xC6, 0xC6, 0xC6, 0x6C, 0x38, 0x00,
    // W (87)
    0xC6, 0xC6, 0xC6, 0xD6, 0xD6, 0xFE, 0x6C, 0x00,
    // X (88)
    0xC6, 0xC6, 0x6C, 0x38, 0x6C, 0xC6, 0xC6, 0x00,
    // Y (89)
    0x66, 0x66, 0x66, 0x3C, 0x18, 0x18, 0x3C, 0x00,
    // Z (90)
    0xFE, 0xC6, 0x8C, 0x18, 0x32, 0x66, 0xFE, 0x00,
    // [ (91)
    0x3C, 0x30, 0x30, 0x30, 0x30, 0x30, 0x3C, 0x00,
    // \ (92)
    0xC0, 0x60, 0x30, 0x18, 0x0C, 0x06, 0x02, 0x00,
    // ] (93)
    0x3C, 0x0C, 0x0C, 0x0C, 0x0C, 0x0C, 0x3C, 0x00,
    // ^ (94)
    0x10, 0x38, 0x6C, 0xC6, 0x00, 0x00, 0x00, 0x00,
    // _ (95)
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0xFF,
    // ` (96)
    0x30, 0x18, 0x0C, 0x00, 0x00, 0x00, 0x00, 0x00,
    // a (97)
    0x00, 0x00, 0x78, 0x0C, 0x7C, 0xCC, 0x76, 0x00,
    // b (98)
    0xE0, 0x60, 0x7C, 0x66, 0x66, 0x66, 0xDC, 0x00,
    // c (99)
    0x00, 0x00, 0x7C, 0xC6, 0xC0, 0xC6, 0x7C, 0x00,
    // d (100)
    0x1C, 0x0C, 0x7C, 0xCC, 0xCC, 0xCC, 0x76, 0x00,
    // e (101)
    0x00, 0x00, 0x7C, 0xC6, 0xFE, 0xC0, 0x7C, 0x00,
    // f (102)
    0x3C, 0x66, 0x60, 0xF8, 0x60, 0x60, 0xF0, 0x00,
    // g (103)
    0x00, 0x00, 0x76, 0xCC, 0xCC, 0x7C, 0x0C, 0x78,
    // h (104)
    0xE0, 0x60, 0x6C, 0x76, 0x66, 0x66, 0xE6, 0x00,
    // i (105)
    0x18, 0x00, 0x38, 0x18, 0x18, 0x18, 0x3C, 0x00,
    // j (106)
    0x06, 0x00, 0x06, 0x06, 0x06, 0x66, 0x66, 0x3C,
    // k (107)
    0xE0, 0x60, 0x66, 0x6C, 0x78, 0x6C, 0xE6, 0x00,
    // l (108)
    0x38, 0x18, 0x18, 0x18, 0x18, 0x18, 0x3C, 0x00,
    // m (109)
    0x00, 0x00, 0xEC, 0xFE, 0xD6, 0xD6, 0xD6, 0x00,
    // n (110)
    0x00, 0x00, 0xDC, 0x66, 0x66, 0x66, 0x66, 0x00,
    // o (111)
    0x00, 0x00, 0x7C, 0xC6, 0xC6, 0xC6, 0x7C, 0x00,
    // p (112)
    0x00, 0x00, 0xDC, 0x66, 0x66, 0x7C, 0x60, 0xF0,
    // q (113)
    0x00, 0x00, 0x76, 0xCC, 0xCC, 0x7C, 0x0C, 0x1E,
    // r (114)
    0x00, 0x00, 0xDC, 0x76, 0x60, 0x60, 0xF0, 0x00,
    // s (115)
    0x00, 0x00, 0x7E, 0xC0, 0x7C, 0x06, 0xFC, 0x00,
    // t (116)
    0x30, 0x30, 0xFC, 0x30, 0x30, 0x36, 0x1C, 0x00,
    // u (117)
    0x00, 0x00, 0xCC, 0xCC, 0xCC, 0xCC, 0x76, 0x00,
    // v (118)
    0x00, 0x00, 0xC6, 0xC6, 0xC6, 0x6C, 0x38, 0x00,
    // w (119)
    0x00, 0x00, 0xC6, 0xD6, 0xD6, 0xFE, 0x6C, 0x00,
    // x (120)
    0x00, 0x00, 0xC6, 0x6C, 0x38, 0x6C, 0xC6, 0x00,
    // y (121)
    0x00, 0x00, 0xC6, 0xC6, 0xC6, 0x7E, 0x06, 0x7C,
    // z (122)
    0x00, 0x00, 0x7E, 0x4C, 0x18, 0x32, 0x7E, 0x00,
    // { (123)
    0x0E, 0x18, 0x18, 0x70, 0x18, 0x18, 0x0E, 0x00,
    // | (124)
    0x18, 0x18, 0x18, 0x18, 0x18, 0x18, 0x18, 0x00,
    // } (125)
    0x70, 0x18, 0x18, 0x0E, 0x18, 0x18, 0x70, 0x00,
    // ~ (126)
    0x76, 0xDC, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    // DEL (127) - block
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
};

const char* BLIT_FRAGMENT_SHADER = R"(
@group(0) @binding(0) var blitSampler: sampler;
@group(0) @binding(1) var blitTexture: texture_2d<f32>;

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    return textureSample(blitTexture, blitSampler, input.uv);
}
)";

const char* TEXT_SHADER = R"(
struct TextUniforms {
    screenSize: vec2f,
    _pad: vec2f,
};

@group(0) @binding(0) var<uniform> uniforms: TextUniforms;
@group(0) @binding(1) var fontSampler: sampler;
@group(0) @binding(2) var fontTexture: texture_2d<f32>;

struct VertexInput {
    @location(0) position: vec2f,
    @location(1) uv: vec2f,
    @location(2) color: vec4f,
};

struct VertexOutput {
    @builtin(position) position: vec4f,
    @location(0) uv: vec2f,
    @location(1) color: vec4f,
};

@vertex
fn vs_main(input: VertexInput) -> VertexOutput {
    var output: VertexOutput;
    let ndc = vec2f(
        (input.position.x / uniforms.screenSize.x) * 2.0 - 1.0,
        (1.0 - input.position.y / uniforms.screenSize.y) * 2.0 - 1.0
    );
    output.position = vec4f(ndc, 0.0, 1.0);
    output.uv = input.uv;
    output.color = input.color;
    return output;
}

@fragment
fn fs_main(input: VertexOutput) -> @location(0) vec4f {
    let coverage = textureSample(fontTexture, fontSampler, input.uv).r;
    if (coverage < 0.5) {
        discard;
    }
    return input.color;
}
)";

// Glyph index for one byte; UTF-8 continuation bytes produce no glyph
int glyphIndex(unsigned char c) {
    if ((c & 0xC0) == 0x80) return -1;
    if (c < 32 || c > 127) c = '?';
    return c - 32;
}

} // namespace

Display::Display(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat surfaceFormat)
    : m_device(device)
    , m_queue(queue)
    , m_surfaceFormat(surfaceFormat)
{
    m_valid = createBlitPipeline();
    if (m_valid) {
        m_valid = createTextPipeline();
    }
}

Display::~Display() {
    shutdown();
}

void Display::shutdown() {
    gpu::release(m_blitBindGroup);
    m_lastBlitTexture = nullptr;
    gpu::release(m_blitPipeline);
    gpu::release(m_blitBindGroupLayout);
    gpu::release(m_textPipeline);
    gpu::release(m_textBindGroup);
    gpu::release(m_textBindGroupLayout);
    gpu::release(m_fontTextureView);
    gpu::release(m_fontTexture);
    gpu::release(m_textUniformBuffer);
    gpu::release(m_textVertexBuffer);
    m_textVertexCapacity = 0;
    m_textVertices.clear();
    m_valid = false;
}

bool Display::createBlitPipeline() {
    gpu::PipelineBuilder builder(m_device);
    builder.label("Glint Blit")
           .shader(std::string(gpu::FULLSCREEN_VERTEX_SHADER) + BLIT_FRAGMENT_SHADER)
           .colorTarget(m_surfaceFormat)
           .sampler(0)
           .texture(1);
    m_blitPipeline = builder.build();
    m_blitBindGroupLayout = builder.bindGroupLayout();

    if (!m_blitPipeline) {
        std::cerr << "[Display] Failed to create blit pipeline" << std::endl;
        return false;
    }
    return true;
}

bool Display::createTextPipeline() {
    // Font texture: 16 glyphs per row, 6 rows, each glyph 8x8
    std::vector<uint8_t> textureData(FONT_TEXTURE_WIDTH * FONT_TEXTURE_HEIGHT, 0);
    for (int charIdx = 0; charIdx < 96; charIdx++) {
        int charX = (charIdx % FONT_CHARS_PER_ROW) * FONT_CHAR_WIDTH;
        int charY = (charIdx / FONT_CHARS_PER_ROW) * FONT_CHAR_HEIGHT;

        for (int row = 0; row < FONT_CHAR_HEIGHT; row++) {
            uint8_t rowBits = FONT_DATA[charIdx * 8 + row];
            for (int col = 0; col < FONT_CHAR_WIDTH; col++) {
                if (rowBits & (0x80 >> col)) {
                    textureData[(charY + row) * FONT_TEXTURE_WIDTH + charX + col] = 255;
                }
            }
        }
    }

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = gpu::toStringView("Glint Font");
    texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.size = {(uint32_t)FONT_TEXTURE_WIDTH, (uint32_t)FONT_TEXTURE_HEIGHT, 1};
    texDesc.format = WGPUTextureFormat_R8Unorm;
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    m_fontTexture = wgpuDeviceCreateTexture(m_device, &texDesc);
    if (!m_fontTexture) {
        std::cerr << "[Display] Failed to create font texture" << std::endl;
        return false;
    }

    WGPUTexelCopyBufferLayout dataLayout = {};
    dataLayout.offset = 0;
    dataLayout.bytesPerRow = FONT_TEXTURE_WIDTH;
    dataLayout.rowsPerImage = FONT_TEXTURE_HEIGHT;

    WGPUTexelCopyTextureInfo destination = {};
    destination.texture = m_fontTexture;
    destination.mipLevel = 0;
    destination.origin = {0, 0, 0};
    destination.aspect = WGPUTextureAspect_All;

    WGPUExtent3D writeSize = {(uint32_t)FONT_TEXTURE_WIDTH, (uint32_t)FONT_TEXTURE_HEIGHT, 1};
    wgpuQueueWriteTexture(m_queue, &destination, textureData.data(), textureData.size(), &dataLayout, &writeSize);

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = WGPUTextureFormat_R8Unorm;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    m_fontTextureView = wgpuTextureCreateView(m_fontTexture, &viewDesc);

    WGPUBufferDescriptor uniformBufferDesc = {};
    uniformBufferDesc.label = gpu::toStringView("Glint Text Uniforms");
    uniformBufferDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    uniformBufferDesc.size = 16;  // vec2f screenSize + padding
    m_textUniformBuffer = wgpuDeviceCreateBuffer(m_device, &uniformBufferDesc);

    if (!m_fontTextureView || !m_textUniformBuffer ||
        !ensureTextCapacity(INITIAL_TEXT_GLYPHS * FLOATS_PER_GLYPH * sizeof(float))) {
        std::cerr << "[Display] Failed to create text resources" << std::endl;
        return false;
    }

    std::vector<WGPUVertexAttribute> attributes(3);
    attributes[0] = {};
    attributes[0].format = WGPUVertexFormat_Float32x2;  // position
    attributes[0].offset = 0;
    attributes[0].shaderLocation = 0;
    attributes[1] = {};
    attributes[1].format = WGPUVertexFormat_Float32x2;  // uv
    attributes[1].offset = 2 * sizeof(float);
    attributes[1].shaderLocation = 1;
    attributes[2] = {};
    attributes[2].format = WGPUVertexFormat_Float32x4;  // color
    attributes[2].offset = 4 * sizeof(float);
    attributes[2].shaderLocation = 2;

    gpu::PipelineBuilder builder(m_device);
    builder.label("Glint Text")
           .shader(TEXT_SHADER)
           .vertexBuffer(8 * sizeof(float), std::move(attributes))
           .colorTargetWithBlend(m_surfaceFormat)
           .uniform(0, 16, WGPUShaderStage_Vertex)
           .sampler(1)
           .texture(2);
    m_textPipeline = builder.build();
    m_textBindGroupLayout = builder.bindGroupLayout();
    if (!m_textPipeline) {
        std::cerr << "[Display] Failed to create text pipeline" << std::endl;
        return false;
    }

    WGPUBindGroupEntry bindGroupEntries[3] = {};
    bindGroupEntries[0].binding = 0;
    bindGroupEntries[0].buffer = m_textUniformBuffer;
    bindGroupEntries[0].offset = 0;
    bindGroupEntries[0].size = 16;
    bindGroupEntries[1].binding = 1;
    bindGroupEntries[1].sampler = gpu::getNearestClampSampler(m_device);
    bindGroupEntries[2].binding = 2;
    bindGroupEntries[2].textureView = m_fontTextureView;

    WGPUBindGroupDescriptor bindGroupDesc = {};
    bindGroupDesc.label = gpu::toStringView("Glint Text Bind Group");
    bindGroupDesc.layout = m_textBindGroupLayout;
    bindGroupDesc.entryCount = 3;
    bindGroupDesc.entries = bindGroupEntries;
    m_textBindGroup = wgpuDeviceCreateBindGroup(m_device, &bindGroupDesc);

    setScreenSize(m_screenWidth, m_screenHeight);
    return m_textBindGroup != nullptr;
}

bool Display::ensureTextCapacity(uint64_t bytes) {
    if (m_textVertexBuffer && m_textVertexCapacity >= bytes) return true;

    uint64_t capacity = m_textVertexCapacity > 0 ? m_textVertexCapacity : bytes;
    while (capacity < bytes) {
        capacity *= 2;
    }

    gpu::release(m_textVertexBuffer);
    WGPUBufferDescriptor vertexBufferDesc = {};
    vertexBufferDesc.label = gpu::toStringView("Glint Text Vertices");
    vertexBufferDesc.usage = WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst;
    vertexBufferDesc.size = capacity;
    m_textVertexBuffer = wgpuDeviceCreateBuffer(m_device, &vertexBufferDesc);
    m_textVertexCapacity = m_textVertexBuffer ? capacity : 0;
    return m_textVertexBuffer != nullptr;
}

void Display::setScreenSize(int width, int height) {
    m_screenWidth = width;
    m_screenHeight = height;

    float uniforms[4] = {(float)width, (float)height, 0.0f, 0.0f};
    wgpuQueueWriteBuffer(m_queue, m_textUniformBuffer, 0, uniforms, sizeof(uniforms));
}

void Display::blit(WGPURenderPassEncoder pass, WGPUTextureView texture) {
    if (!m_blitPipeline || !texture) return;

    if (texture != m_lastBlitTexture || !m_blitBindGroup) {
        gpu::release(m_blitBindGroup);

        WGPUBindGroupEntry entries[2] = {};
        entries[0].binding = 0;
        entries[0].sampler = gpu::getLinearClampSampler(m_device);
        entries[1].binding = 1;
        entries[1].textureView = texture;

        WGPUBindGroupDescriptor bindGroupDesc = {};
        bindGroupDesc.label = gpu::toStringView("Glint Blit Bind Group");
        bindGroupDesc.layout = m_blitBindGroupLayout;
        bindGroupDesc.entryCount = 2;
        bindGroupDesc.entries = entries;

        m_blitBindGroup = wgpuDeviceCreateBindGroup(m_device, &bindGroupDesc);
        m_lastBlitTexture = texture;

        if (!m_blitBindGroup) {
            std::cerr << "[Display] Failed to create blit bind group" << std::endl;
            return;
        }
    }

    wgpuRenderPassEncoderSetViewport(pass, 0, 0, (float)m_screenWidth, (float)m_screenHeight, 0, 1);
    wgpuRenderPassEncoderSetScissorRect(pass, 0, 0, m_screenWidth, m_screenHeight);

    wgpuRenderPassEncoderSetPipeline(pass, m_blitPipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, m_blitBindGroup, 0, nullptr);
    wgpuRenderPassEncoderDraw(pass, 3, 1, 0, 0);
}

void Display::queueText(const std::string& text, float x, float y, float scale, const Color& color) {
    const float charWidth = FONT_CHAR_WIDTH * scale;
    const float charHeight = FONT_CHAR_HEIGHT * scale;
    const float texCharWidth = (float)FONT_CHAR_WIDTH / FONT_TEXTURE_WIDTH;
    const float texCharHeight = (float)FONT_CHAR_HEIGHT / FONT_TEXTURE_HEIGHT;
    const float r = color.r, g = color.g, b = color.b, a = color.a;

    float cursorX = x;
    float cursorY = y;

    for (char ch : text) {
        if (ch == '\n') {
            cursorX = x;
            cursorY += charHeight + 2 * scale;
            continue;
        }

        int charIdx = glyphIndex(static_cast<unsigned char>(ch));
        if (charIdx < 0) continue;

        float texX = (charIdx % FONT_CHARS_PER_ROW) * texCharWidth;
        float texY = (charIdx / FONT_CHARS_PER_ROW) * texCharHeight;
        float x1 = cursorX + charWidth;
        float y1 = cursorY + charHeight;

        m_textVertices.insert(m_textVertices.end(), {
            cursorX, cursorY, texX, texY, r, g, b, a,
            x1, cursorY, texX + texCharWidth, texY, r, g, b, a,
            cursorX, y1, texX, texY + texCharHeight, r, g, b, a,

            x1, cursorY, texX + texCharWidth, texY, r, g, b, a,
            x1, y1, texX + texCharWidth, texY + texCharHeight, r, g, b, a,
            cursorX, y1, texX, texY + texCharHeight, r, g, b, a,
        });

        cursorX += charWidth;
    }
}

void Display::drawText(WGPURenderPassEncoder pass) {
    if (!m_textPipeline || m_textVertices.empty()) {
        m_textVertices.clear();
        return;
    }

    uint64_t bytes = m_textVertices.size() * sizeof(float);
    if (!ensureTextCapacity(bytes)) {
        std::cerr << "[Display] Dropping " << queuedGlyphs() << " glyphs, vertex buffer allocation failed" << std::endl;
        m_textVertices.clear();
        return;
    }

    wgpuQueueWriteBuffer(m_queue, m_textVertexBuffer, 0, m_textVertices.data(), bytes);

    wgpuRenderPassEncoderSetPipeline(pass, m_textPipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, m_textBindGroup, 0, nullptr);
    wgpuRenderPassEncoderSetVertexBuffer(pass, 0, m_textVertexBuffer, 0, bytes);
    wgpuRenderPassEncoderDraw(pass, (uint32_t)(m_textVertices.size() / 8), 1, 0, 0);

    m_textVertices.clear();
}

} // namespace glint
