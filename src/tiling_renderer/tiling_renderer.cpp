#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <string>
#include <thread>

#include "imgui.h"
#include "imgui_impl_sdl2.h"
#include "imgui_impl_sdlrenderer2.h"

#include "tiling_renderer.hpp"
#include "../colour/colour.hpp"
#include "../errors/tiling_errors.hpp"
#include "../models/models.hpp"
#include "../utils/io/image.hpp"

const unsigned int MIN_WIN_WIDTH = 600;
const unsigned int MIN_WIN_HEIGHT = 450;

const std::string IMAGE_PATH = "./saved_images";

const char* const INVALID_TILING_MESSAGE = "This is not a valid hyperbolic tiling. Try changing the parameters.";
const char* const DEGENERATE_TILING_MESSAGE = "The edges are too thick for this tiling. Try a smaller thickness.";

const ImGuiWindowFlags BASE_WINDOW_FLAGS =
ImGuiWindowFlags_AlwaysAutoResize |
ImGuiWindowFlags_NoSavedSettings |
ImGuiWindowFlags_NoFocusOnAppearing |
ImGuiWindowFlags_NoNav;

static ImVec4 toImVec4(const colour& col) {
    return ImVec4(col.r / 255.0f, col.g / 255.0f, col.b / 255.0f, 1.0f);
}

TilingRenderer::TilingRenderer(unsigned int width, unsigned int height)
    : winWidth(width), winHeight(height),
    isRecalculatingTiling(false),
    cancelRender(false),
    frameReady(false),
    renderProgress(0)
{
    // Setup SDL
    if (SDL_Init(SDL_INIT_VIDEO)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Could not initialise SDL: %s", SDL_GetError());
        exit(EXIT_FAILURE);
    }

    unsigned int windowFlags = SDL_WINDOW_RESIZABLE | SDL_WINDOW_SHOWN;
    window = SDL_CreateWindow("Hyperbolic Illusion", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, winWidth, winHeight, windowFlags);
    if (window == nullptr) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Couldn't create window: %s", SDL_GetError());
        exit(EXIT_FAILURE);
    }
    SDL_SetWindowMinimumSize(window, MIN_WIN_WIDTH, MIN_WIN_HEIGHT);

    renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (renderer == nullptr) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Couldn't create renderer: %s", SDL_GetError());
        exit(EXIT_FAILURE);
    }

    // Setup ImGui
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();

    ImGui::StyleColorsDark();

    ImGui_ImplSDL2_InitForSDLRenderer(window, renderer);
    ImGui_ImplSDLRenderer2_Init(renderer);

    modelOptions = {
        { 0, SDLK_1 },
        { 1, SDLK_2 },
        { 2, SDLK_3 },
        { 3, SDLK_4 },
        { 4, SDLK_5 },
        { 5, SDLK_6 },
        { 6, SDLK_7 },
        { 7, SDLK_8 },
    };

    curResolutionIdx = 0;
    resolutionOptions = {
        { "100%", 1.0f },
        { "50%", std::sqrt(0.5f) },
        { "25%", 0.5f },
        { "12.5%", std::sqrt(0.125f) },
        { "6.25%", 0.25f },
    };

    // The defaults always describe a valid tiling
    try {
        descriptor = tilingCache.get(settings.p, settings.q, settings.edgeThickness);
    } catch (const std::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Couldn't generate the initial tiling: %s", e.what());
        exit(EXIT_FAILURE);
    }

    syncInputs();
}

TilingRenderer::~TilingRenderer() {
    cancelRender = true;
    if (renderingTask.valid())
        renderingTask.wait();

    ImGui_ImplSDLRenderer2_Shutdown();
    ImGui_ImplSDL2_Shutdown();
    ImGui::DestroyContext();

    if (tilingTexture) {
        SDL_DestroyTexture(tilingTexture);
        tilingTexture = nullptr;
    }

    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }

    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }

    pixelDataBuffer.clear();

    SDL_Quit();
}

void TilingRenderer::handleEvents() {
    SDL_Event event;
    SDL_Keycode eventKey;

    while (SDL_PollEvent(&event)) {
        ImGui_ImplSDL2_ProcessEvent(&event);

        ImGuiIO& io = ImGui::GetIO();
        bool mouseInImGui = io.WantCaptureMouse;
        bool keyboardInImGui = io.WantCaptureKeyboard;

        switch (event.type) {
            case SDL_QUIT:
                running = false;
                break;

            case SDL_MOUSEBUTTONDOWN:
                if (mouseInImGui || event.button.button != SDL_BUTTON_LEFT)
                    break;

                // Start dragging when the click lands inside the disk
                if (setPanFromScreen(event.button.x, event.button.y)) {
                    dragging = true;
                    beginAsyncRendering(false);
                }
                break;

            case SDL_MOUSEMOTION:
                if (!dragging)
                    break;

                if (setPanFromScreen(event.motion.x, event.motion.y)) {
                    beginAsyncRendering(false);
                }
                else {
                    dragging = false;
                    beginAsyncRendering();
                }
                break;

            case SDL_MOUSEBUTTONUP:
                if (dragging && event.button.button == SDL_BUTTON_LEFT) {
                    dragging = false;
                    beginAsyncRendering();
                }
                break;

            case SDL_KEYDOWN:
                if (!keyboardInImGui) {
                    eventKey = event.key.keysym.sym;

                    if (eventKey == SDLK_ESCAPE) {
                        running = false;
                    }
                    else if (eventKey == SDLK_TAB) {
                        uiVisible = !uiVisible;
                    }
                    else if (eventKey == SDLK_f) {
                        beginAsyncRendering();
                    }
                    else if (eventKey == SDLK_r) {
                        resetPan();
                    }
                    else if (eventKey == SDLK_s) {
                        saveSnapshot();
                    }
                    else {
                        for (const modelOption& option : modelOptions) {
                            if (eventKey == option.key) {
                                selectModel(option.modelIdx);
                                break;
                            }
                        }
                    }
                }
                break;

            case SDL_WINDOWEVENT:
                if (event.window.event == SDL_WINDOWEVENT_RESIZED || event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                    int newWidth, newHeight;
                    SDL_GetWindowSize(window, &newWidth, &newHeight);
                    setWindowSize(newWidth, newHeight);
                }
                break;

            default:
                break;
        }
    }
}

void TilingRenderer::setWindowSize(unsigned int width, unsigned int height) {
    if (width == winWidth && height == winHeight)
        return;

    winWidth = width;
    winHeight = height;

    SDL_RenderSetLogicalSize(renderer, winWidth, winHeight);

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);
    SDL_RenderPresent(renderer);

    beginAsyncRendering();
}

void TilingRenderer::resetPan() {
    if (panOffset.real() == INITIAL_PAN_X && panOffset.imag() == INITIAL_PAN_Y)
        return;

    panOffset = Complex(INITIAL_PAN_X, INITIAL_PAN_Y);
    beginAsyncRendering();
}

bool TilingRenderer::setPanFromScreen(int mx, int my) {
    Complex viewPos = screenToView(mx, my, winWidth, winHeight);
    Complex diskPos = applyModel(settings.modelIdx, viewPos);

    if (!(Complex::magSq(diskPos) < 1.0))
        return false;

    panOffset = diskPos;
    return true;
}

void TilingRenderer::selectResolution(unsigned int resolutionIndex) {
    if (resolutionIndex == curResolutionIdx)
        return;

    curResolutionIdx = resolutionIndex;
    beginAsyncRendering();
}

void TilingRenderer::selectModel(unsigned int modelIndex) {
    if (modelIndex == settings.modelIdx)
        return;

    tilingSettings next = settings;
    next.modelIdx = modelIndex;
    applySettings(next);
}

void TilingRenderer::applySettings(const tilingSettings& requested) {
    tilingSettings next = sanitizeSettings(requested);

    bool geometryChanged = next.p != settings.p || next.q != settings.q || next.edgeThickness != settings.edgeThickness;
    if (geometryChanged) {
        // A rejected tiling keeps the previous descriptor on screen
        try {
            descriptor = tilingCache.get(next.p, next.q, next.edgeThickness);
            tilingError.clear();
            SDL_Log("Generated tiling {%d, %d} with edge thickness %.3f", next.p, next.q, next.edgeThickness);
        } catch (const InvalidTilingError& e) {
            tilingError = INVALID_TILING_MESSAGE;
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Rejected tiling: %s", e.what());
            return;
        } catch (const DegenerateGeometryError& e) {
            tilingError = DEGENERATE_TILING_MESSAGE;
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Degenerate tiling {%d, %d}, thickness %.3f: %s", next.p, next.q, next.edgeThickness, e.what());
            return;
        }
    }

    settings = next;
    beginAsyncRendering();
}

void TilingRenderer::applyPreset(presetKind kind) {
    applySettings(makePreset(kind, settings.edgeThickness));
    syncInputs();
    SDL_Log("Applied preset: %s", presetName(kind).c_str());
}

void TilingRenderer::syncInputs() {
    inputP = settings.p;
    inputQ = settings.q;
    inputEdgeThickness = static_cast<float>(settings.edgeThickness);
}

void TilingRenderer::beginAsyncRendering(bool fullRender) {
    if (isRecalculatingTiling) {
        cancelRender = true;
        if (renderingTask.valid())
            renderingTask.wait();

        cancelRender = false;
    }

    isRecalculatingTiling = true;

    // Calculate render size based off resolution
    float lengthScaleFactor = resolutionOptions[curResolutionIdx].lengthScaleFactor;
    unsigned int width = std::max(1u, static_cast<unsigned int>(winWidth * lengthScaleFactor));
    unsigned int height = std::max(1u, static_cast<unsigned int>(winHeight * lengthScaleFactor));

    {
        std::lock_guard<std::mutex> lock(renderMutex);
        renderWidth = width;
        renderHeight = height;
        pixelDataBuffer.assign(static_cast<size_t>(width) * height, 0);
        frameReady = false;
    }

    renderProgress = 0;
    renderMaxProgress = width;

    // Each render works on its own copy, later parameter changes never reach it
    frameSnapshot frame{ descriptor, settings, panOffset };
    unsigned int nSamples = fullRender ? settings.nSamples : PREVIEW_SAMPLES;

    renderingTask = std::async(std::launch::async, [this, frame, nSamples, width, height]() {
        int numThreads = std::max(1u, std::thread::hardware_concurrency());
        std::vector<std::thread> threads;
        int sectionWidth = width / numThreads;

        SDL_PixelFormat* pixelFormat = SDL_AllocFormat(SDL_PIXELFORMAT_RGBA32);
        if (pixelFormat == nullptr) {
            SDL_LogError(SDL_LOG_CATEGORY_ERROR, "Failed to allocate pixel format: %s", SDL_GetError());
            isRecalculatingTiling = false;
            return;
        }

        // Create a thread for each vertical slice
        for (int i = 0; i < numThreads; ++i) {
            int startX = i * sectionWidth;
            int endX = (i == numThreads - 1) ? width : (i + 1) * sectionWidth;

            threads.emplace_back([this, &frame, startX, endX, nSamples, pixelFormat, width, height]() {
                std::vector<unsigned int> column(height);

                for (int x = startX; x < endX; x++) {
                    for (unsigned int y = 0; y < height; y++) {
                        if (cancelRender)
                            return;

                        colour col = shadePixel(x, y, width, height, frame, nSamples);
                        column[y] = SDL_MapRGB(pixelFormat, col.r, col.g, col.b);
                    }

                    std::lock_guard<std::mutex> lock(renderMutex);
                    for (unsigned int y = 0; y < height; y++)
                        pixelDataBuffer[static_cast<size_t>(y) * width + x] = column[y];

                    renderProgress++;
                }
            });
        }

        // Wait for all threads to finish
        for (auto& t : threads)
            if (t.joinable())
                t.join();

        SDL_FreeFormat(pixelFormat);

        if (!cancelRender)
            frameReady = true;

        isRecalculatingTiling = false;
    });
}

void TilingRenderer::uploadFinishedFrame() {
    if (!frameReady)
        return;

    std::lock_guard<std::mutex> lock(renderMutex);
    frameReady = false;

    int textureWidth = 0, textureHeight = 0;
    if (tilingTexture)
        SDL_QueryTexture(tilingTexture, nullptr, nullptr, &textureWidth, &textureHeight);

    if (tilingTexture == nullptr || textureWidth != static_cast<int>(renderWidth) || textureHeight != static_cast<int>(renderHeight)) {
        if (tilingTexture)
            SDL_DestroyTexture(tilingTexture);

        tilingTexture = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_RGBA32, SDL_TEXTUREACCESS_STREAMING, renderWidth, renderHeight);
        if (tilingTexture == nullptr) {
            SDL_LogError(SDL_LOG_CATEGORY_ERROR, "Failed to create texture: %s", SDL_GetError());
            return;
        }
    }

    if (SDL_UpdateTexture(tilingTexture, nullptr, pixelDataBuffer.data(), renderWidth * sizeof(unsigned int)) < 0)
        SDL_LogError(SDL_LOG_CATEGORY_ERROR, "Couldn't update tiling texture: %s", SDL_GetError());
}

void TilingRenderer::saveSnapshot() {
    if (isRecalculatingTiling) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Render still in progress, snapshot skipped");
        return;
    }

    std::string filename = generatePNGFilename();

    std::lock_guard<std::mutex> lock(renderMutex);
    if (savePixelsAsPNG(pixelDataBuffer, renderWidth, renderHeight, filename))
        SDL_Log("Saved %s", filename.c_str());
}

void TilingRenderer::drawTilingInfo() {
    ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_Once);

    ImGui::Begin("Tiling Info", nullptr, BASE_WINDOW_FLAGS);
    ImGui::Text("Tiling: {%d, %d}", settings.p, settings.q);
    ImGui::Text("Model: %s", modelName(settings.modelIdx).c_str());
    ImGui::Text("Centre: %.6f %+.6fi", panOffset.real(), panOffset.imag());
    ImGui::Text("Iterations: %u", settings.nIterations);
    ImGui::Text("Samples: %ux%u", settings.nSamples, settings.nSamples);
    ImGui::End();
}

void TilingRenderer::drawTilingControls() {
    ImGui::SetNextWindowPos(ImVec2(10, 150), ImGuiCond_Once);

    ImGui::Begin("Tiling", nullptr, BASE_WINDOW_FLAGS);

    ImGui::PushItemWidth(160.0f);
    bool symbolChanged = ImGui::SliderInt("Number of Sides", &inputP, MIN_SIDES, MAX_SIDES);
    symbolChanged |= ImGui::SliderInt("Polygons Around a Vertex", &inputQ, MIN_SIDES, MAX_SIDES);
    ImGui::PopItemWidth();

    if (symbolChanged) {
        tilingSettings next = settings;
        next.p = inputP;
        next.q = inputQ;
        applySettings(next);
    }

    if (!tilingError.empty())
        ImGui::TextColored(ImVec4(1.0f, 0.35f, 0.35f, 1.0f), "%s", tilingError.c_str());

    ImGui::Separator();
    ImGui::Text("Illusion preset");

    bool doSnake = settings.doSnake;
    if (ImGui::Checkbox(presetName(presetKind::RotatingSnakes).c_str(), &doSnake)) {
        applySettings(setRotatingSnakes(settings, doSnake));
        syncInputs();
    }

    if (settings.doSnake) {
        tilingSettings next = settings;
        bool changed = false;

        float expRatio = static_cast<float>(next.expRatioRings);
        float cutoff = static_cast<float>(next.centerCutoff);

        ImGui::PushItemWidth(160.0f);
        if (ImGui::SliderFloat("Exponential Ratio (Rings)", &expRatio, MIN_EXP_RATIO_RINGS, MAX_EXP_RATIO_RINGS, "%.3f")) {
            next.expRatioRings = expRatio;
            changed = true;
        }
        changed |= ImGui::SliderScalar("Number of Ring Layers", ImGuiDataType_U32, &next.ringLayerNum, &MIN_RING_LAYERS, &MAX_RING_LAYERS);
        if (ImGui::SliderFloat("Center Cutoff", &cutoff, MIN_CENTER_CUTOFF, MAX_CENTER_CUTOFF, "%.2f")) {
            next.centerCutoff = cutoff;
            changed = true;
        }
        changed |= ImGui::SliderScalar("Front Patterns per Arc", ImGuiDataType_U32, &next.nRepeatPerSectV0, &MIN_REPEATS_PER_SECTOR, &MAX_REPEATS_PER_SECTOR);
        changed |= ImGui::SliderScalar("Behind Patterns per Arc", ImGuiDataType_U32, &next.nRepeatPerSectV2, &MIN_REPEATS_PER_SECTOR, &MAX_REPEATS_PER_SECTOR);
        changed |= ImGui::Checkbox("Reverse Front Rings", &next.doForeRev);
        changed |= ImGui::Checkbox("Reverse Behind Rings", &next.doBackRev);
        ImGui::PopItemWidth();

        if (changed)
            applySettings(next);
    }

    for (presetKind kind : ILLUSION_PRESETS) {
        if (ImGui::Button(presetName(kind).c_str()))
            applyPreset(kind);
    }

    ImGui::End();
}

void TilingRenderer::drawEdgeVertexControls() {
    ImGui::SetNextWindowPos(ImVec2(10, 430), ImGuiCond_Once);

    ImGui::Begin("Edges & Vertices", nullptr, BASE_WINDOW_FLAGS);

    tilingSettings next = settings;
    bool changed = false;

    changed |= ImGui::Checkbox("Show Edges", &next.doEdges);
    if (next.doEdges) {
        changed |= ImGui::Checkbox("Show Edge a", &next.doV1V2);
        ImGui::SameLine();
        changed |= ImGui::Checkbox("Show Edge b", &next.doV0V1);
        ImGui::SameLine();
        changed |= ImGui::Checkbox("Show Edge c", &next.doV2V0);
        changed |= ImGui::Checkbox("Precise Edges", &next.preciseEdges);
        changed |= drawPaletteCombo("Edge Color", next.edgeColIdx);
    }

    bool doVerts = next.doVerts;
    if (ImGui::Checkbox("Show Circular Vertices", &doVerts)) {
        next = setCircularVertices(next, doVerts);
        changed = true;
    }

    bool doOrns = next.doOrns;
    if (ImGui::Checkbox("Show Ornamented Vertices", &doOrns)) {
        next = setOrnamentedVertices(next, doOrns);
        changed = true;
    }

    if (next.doVerts || next.doOrns) {
        changed |= drawPaletteCombo("Vertex Color", next.vertColIdx);
        changed |= ImGui::Checkbox("Primrose Field Style Colored Vertices", &next.doInvVerts);
        if (next.doInvVerts)
            changed |= drawPaletteCombo("Second Vertex Color", next.invVertColIdx);
    }

    // Thickness also sizes the vertices and ornaments
    if (next.doEdges || next.doVerts || next.doOrns) {
        ImGui::PushItemWidth(160.0f);
        if (ImGui::SliderFloat("Edge Thickness", &inputEdgeThickness, MIN_EDGE_THICKNESS, MAX_EDGE_THICKNESS, "%.3f")) {
            next.edgeThickness = inputEdgeThickness;
            changed = true;
        }
        ImGui::PopItemWidth();
    }

    if (changed)
        applySettings(next);

    ImGui::End();
}

void TilingRenderer::drawAppearanceSettings() {
    ImGui::SetNextWindowPos(ImVec2(390, 10), ImGuiCond_Once);

    ImGui::Begin("Appearance", nullptr, BASE_WINDOW_FLAGS);

    tilingSettings next = settings;
    bool changed = false;

    ImGui::SetNextItemWidth(220);
    if (ImGui::BeginCombo("Model", modelName(next.modelIdx).c_str())) {
        for (unsigned int i = 0; i < MODEL_COUNT; i++) {
            bool isSelected = next.modelIdx == i;
            if (ImGui::Selectable(modelName(i).c_str(), isSelected)) {
                next.modelIdx = i;
                changed = true;
            }

            if (isSelected) ImGui::SetItemDefaultFocus();
        }
        ImGui::EndCombo();
    }

    bool doSolidColor = next.doSolidColor;
    if (ImGui::Checkbox("Use Static Polygon Color", &doSolidColor)) {
        next = setSolidColour(next, doSolidColor);
        changed = true;
    }
    if (next.doSolidColor)
        changed |= drawPaletteCombo("Polygon Color", next.polygonColIdx);

    bool doInvPol = next.doInvPol;
    if (ImGui::Checkbox("Checkerboard-colored Polygon", &doInvPol)) {
        next = setCheckerboard(next, doInvPol);
        changed = true;
    }
    if (next.doInvPol)
        changed |= drawPaletteCombo("Second Polygon Color", next.invPolygonColIdx);

    changed |= ImGui::Checkbox("Show Embedded Triangles", &next.doParity);
    changed |= drawPaletteCombo("Background Color", next.bgColIdx);

    if (changed)
        applySettings(next);

    ImGui::End();
}

void TilingRenderer::drawRenderingSettings() {
    ImGui::SetNextWindowPos(ImVec2(390, 230), ImGuiCond_Once);

    ImGui::Begin("Rendering Settings", nullptr, BASE_WINDOW_FLAGS);

    tilingSettings next = settings;
    bool changed = false;

    ImGui::PushItemWidth(160.0f);
    changed |= ImGui::SliderScalar("Number of Iterations", ImGuiDataType_U32, &next.nIterations, &MIN_ITERATIONS, &MAX_ITERATIONS);
    changed |= ImGui::SliderScalar("Antialiasing Steps", ImGuiDataType_U32, &next.nSamples, &MIN_SAMPLES, &MAX_SAMPLES);
    ImGui::PopItemWidth();

    if (changed)
        applySettings(next);

    ImGui::Text("Resolution");
    ImGui::SameLine();
    ImGui::SetNextItemWidth(64);
    if (ImGui::BeginCombo("##Resolution", resolutionOptions[curResolutionIdx].name.c_str())) {
        for (unsigned int i = 0; i < resolutionOptions.size(); i++) {
            bool isSelected = curResolutionIdx == i;
            if (ImGui::Selectable(resolutionOptions[i].name.c_str(), isSelected))
                selectResolution(i);

            if (isSelected) ImGui::SetItemDefaultFocus();
        }
        ImGui::EndCombo();
    }

    if (ImGui::Button("Full Render"))
        beginAsyncRendering();

    ImGui::SameLine();
    if (ImGui::Button("Save Image"))
        saveSnapshot();

    ImGui::End();
}

void TilingRenderer::drawProgressBar() {
    ImGui::SetNextWindowPos(ImVec2(390, 360), ImGuiCond_Once);

    ImGui::Begin("Render Progress", nullptr, BASE_WINDOW_FLAGS);
    float progress = static_cast<float>(renderProgress) / renderMaxProgress;
    ImGui::ProgressBar(progress, ImVec2(0.0f, 0.0f), progress >= 1.0f ? "Finished" : "Rendering...");
    ImGui::End();
}

bool TilingRenderer::drawPaletteCombo(const char* label, unsigned int& colourIdx) {
    bool changed = false;

    ImGui::PushID(label);
    ImGui::ColorButton("##current", toImVec4(paletteColour(colourIdx)), ImGuiColorEditFlags_NoTooltip);
    ImGui::SameLine();
    ImGui::SetNextItemWidth(140);
    if (ImGui::BeginCombo(label, PALETTE_NAMES[colourIdx % PALETTE_SIZE])) {
        for (unsigned int i = 0; i < PALETTE_SIZE; i++) {
            bool isSelected = colourIdx == i;

            ImGui::PushID(static_cast<int>(i));
            ImGui::ColorButton("##swatch", toImVec4(PALETTE[i]), ImGuiColorEditFlags_NoTooltip, ImVec2(14, 14));
            ImGui::PopID();
            ImGui::SameLine();

            if (ImGui::Selectable(PALETTE_NAMES[i], isSelected)) {
                colourIdx = i;
                changed = true;
            }

            if (isSelected) ImGui::SetItemDefaultFocus();
        }
        ImGui::EndCombo();
    }
    ImGui::PopID();

    return changed;
}

void TilingRenderer::renderFrame() {
    uploadFinishedFrame();

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);

    if (tilingTexture != nullptr)
        SDL_RenderCopy(renderer, tilingTexture, nullptr, nullptr);

    if (uiVisible) {
        ImGui_ImplSDLRenderer2_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        drawTilingInfo();
        drawTilingControls();
        drawEdgeVertexControls();
        drawAppearanceSettings();
        drawRenderingSettings();
        drawProgressBar();

        ImGui::Render();
        ImGui_ImplSDLRenderer2_RenderDrawData(ImGui::GetDrawData());
    }

    SDL_RenderPresent(renderer);
}

void TilingRenderer::run() {
    beginAsyncRendering();

    while (running) {
        handleEvents();
        renderFrame();
    }
}

std::string TilingRenderer::generatePNGFilename() {
    if (!std::filesystem::exists(IMAGE_PATH))
        std::filesystem::create_directories(IMAGE_PATH);

    std::string prefix = "tiling-" + std::to_string(settings.p) + "-" + std::to_string(settings.q);

    int highestNum = 0;
    std::regex pattern(prefix + "-(\\d+)\\.png");  // Match format "tiling-p-q-<number>.png"

    for (const auto& entry : std::filesystem::directory_iterator(IMAGE_PATH)) {
        std::string filename = entry.path().filename().string();
        std::smatch match;

        if (std::regex_match(filename, match, pattern) && match.size() > 1) {
            int fileNumber = std::stoi(match[1].str());
            highestNum = std::max(highestNum, fileNumber);
        }
    }

    std::string newFilename = prefix + "-" + std::to_string(highestNum + 1) + ".png";
    return (std::filesystem::path(IMAGE_PATH) / newFilename).string();
}
