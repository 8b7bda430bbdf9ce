/**
 * @file EditService.hpp
 * Seam to the external image-editing model.
 */
#pragma once
#include <string>
#include "models/ImageTypes.hpp"

namespace alphapunch {

class EditService
{
public:
    virtual ~EditService() = default;

    /**
     * @brief Asks the model to repaint removable regions with the key color.
     * @param image       Encoded source image.
     * @param mimeType    MIME type of @p image.
     * @param prompt      Edit instruction.
     * @param highQuality Use the slower, higher quality model tier.
     * @return Encoded edited image.
     * @throws EditServiceError (or any std::exception) on failure. No retries
     *         are expected from the caller.
     */
    virtual Bytes edit(const Bytes& image, const std::string& mimeType,
                       const std::string& prompt, bool highQuality) = 0;
};

}
