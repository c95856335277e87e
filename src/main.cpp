#include "tiling_renderer/tiling_renderer.hpp"

const unsigned int INITIAL_WIN_WIDTH = 1280;
const unsigned int INITIAL_WIN_HEIGHT = 800;

int main(int argc, char* argv[]) {
    TilingRenderer tilingRenderer(INITIAL_WIN_WIDTH, INITIAL_WIN_HEIGHT);
    tilingRenderer.run();

    return 0;
}
