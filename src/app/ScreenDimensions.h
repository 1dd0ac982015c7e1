#pragma once

struct ScreenDimensions
{
    int width = 0;
    int height = 0;
};
