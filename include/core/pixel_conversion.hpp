#pragma once

#include <opencv2/core.hpp>

/**
 * @brief Normalizes any decoded pixel layout to the 8-bit views the
 * analyzers work on
 */
class PixelConversion
{
public:
    /**
     * @brief 8-bit, 3-channel BGR. Alpha is dropped, gray is replicated.
     */
    static cv::Mat toBgr8(const cv::Mat &pixels);

    /**
     * @brief 8-bit single-channel luma (ITU-R 601-2 weights)
     */
    static cv::Mat toGray8(const cv::Mat &pixels);

private:
    static cv::Mat toDepth8(const cv::Mat &pixels);
};
