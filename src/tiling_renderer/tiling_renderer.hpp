#ifndef TILING_RENDERER_H
#define TILING_RENDERER_H

#include <atomic>
#include <future>
#include <mutex>
#include <string>
#include <vector>

#include <SDL2/SDL.h>

#include "../classifier/classifier.hpp"
#include "../complex/complex.hpp"
#include "../options/render_options.hpp"
#include "../presets/presets.hpp"
#include "../settings/settings.hpp"
#include "../tiling/tiling.hpp"

const float INITIAL_PAN_X = 0.0;
const float INITIAL_PAN_Y = 0.0;

// Antialiasing used while the tiling is being dragged
const unsigned int PREVIEW_SAMPLES = 1;

class TilingRenderer {
    public:
        TilingRenderer(unsigned int width, unsigned int height);
        ~TilingRenderer();

        void run();

    private:
        void handleEvents();

        void setWindowSize(unsigned int width, unsigned int height);
        void resetPan();
        bool setPanFromScreen(int mx, int my);
        void selectResolution(unsigned int resolutionIndex);
        void selectModel(unsigned int modelIndex);
        void applySettings(const tilingSettings& next);
        void applyPreset(presetKind kind);
        void syncInputs();

        void beginAsyncRendering(bool fullRender = true);
        void uploadFinishedFrame();
        void saveSnapshot();

        void drawTilingInfo();
        void drawTilingControls();
        void drawEdgeVertexControls();
        void drawAppearanceSettings();
        void drawRenderingSettings();
        void drawProgressBar();
        bool drawPaletteCombo(const char* label, unsigned int& colourIdx);

        void renderFrame();

        std::string generatePNGFilename();

        unsigned int winWidth;
        unsigned int winHeight;

        SDL_Window* window = nullptr;
        SDL_Renderer* renderer = nullptr;
        SDL_Texture* tilingTexture = nullptr;

        tilingSettings settings;
        tilingDescriptor descriptor;
        TilingCache tilingCache;
        std::string tilingError;
        Complex panOffset = Complex(INITIAL_PAN_X, INITIAL_PAN_Y);

        // Slider state, committed through applySettings
        int inputP;
        int inputQ;
        float inputEdgeThickness;

        bool dragging = false;
        bool running = true;
        bool uiVisible = true;

        std::atomic<bool> isRecalculatingTiling;
        std::atomic<bool> cancelRender;
        std::atomic<bool> frameReady;
        std::future<void> renderingTask;
        std::mutex renderMutex;
        std::vector<unsigned int> pixelDataBuffer;
        unsigned int renderWidth = 0;
        unsigned int renderHeight = 0;
        std::atomic<unsigned int> renderProgress;
        unsigned int renderMaxProgress = 1;

        std::vector<resolutionOption> resolutionOptions;
        unsigned int curResolutionIdx;

        std::vector<modelOption> modelOptions;
};

#endif
