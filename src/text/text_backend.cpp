/**
 * @file text_backend.cpp
 * @brief Build-time backend selection
 */

#include "text/text_backend.hpp"

#if defined(PE_TEXT_BACKEND_FREETYPE)
#include "text/freetype_text_backend.hpp"
#else
#include "text/stb_text_backend.hpp"
#endif

namespace PosterEngine::Text {

std::unique_ptr<TextBackend>
TextBackend::create(std::shared_ptr<const FontSet> fonts) {
#if defined(PE_TEXT_BACKEND_FREETYPE)
  return std::make_unique<FreeTypeTextBackend>(std::move(fonts));
#else
  return std::make_unique<StbTextBackend>(std::move(fonts));
#endif
}

} // namespace PosterEngine::Text
