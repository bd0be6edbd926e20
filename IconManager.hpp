#pragma once

#include <map>
#include "imgui.h"
#include "OutputLog.hpp"

class IconManager {
public:
  explicit IconManager(OutputLog *log);
  ~IconManager();

  void loadIcons(float dpiScale = 1.0f);
  ImTextureID loadSVGTexture(const char *filename, float targetHeight);
  ImTextureID icon(OutputIcon kind) const;
  bool iconTextButton(const char *id, OutputIcon kind, const char *label,
                      const ImVec2 &buttonSize);

private:
  OutputLog *log_;
  std::map<OutputIcon, ImTextureID> icons_;
};
