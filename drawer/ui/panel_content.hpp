#ifndef E3A1C0F2_6B4D_4E8A_9C17_5D2F8B0A4E61
#define E3A1C0F2_6B4D_4E8A_9C17_5D2F8B0A4E61

#include "config.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace drawer::ui {

struct MenuItem {
  std::string title;
  std::optional<std::string> icon;
  std::function<void()> onTap;
};

struct PanelContext;

// Draws (part of) the panel behind the content, implemented by the host UI
struct IPanelContentRenderer {
  virtual ~IPanelContentRenderer() = default;
  virtual void render(const PanelContext &context) = 0;
};

typedef std::shared_ptr<IPanelContentRenderer> PanelContentRendererPtr;

// Optional overrides for what is shown in the panel
struct DrawerSlots {
  // Replaces the whole panel
  PanelContentRendererPtr drawer;
  // Shown above the content or the generated item list
  PanelContentRendererPtr head;
  // Replaces the generated item list
  PanelContentRendererPtr content;
  std::vector<MenuItem> items;
};

enum class PanelContentSource { FullOverride, ContentOverride, GeneratedFromItems, Empty };

// Result of resolving the slots, passed to the renderers
struct PanelContext {
  PanelContentSource source = PanelContentSource::Empty;
  PanelContentRendererPtr renderer;
  PanelContentRendererPtr head;
  // Keeps the slots alive for as long as the context, items points into them
  std::shared_ptr<const DrawerSlots> slots;
  std::span<const MenuItem> items;
  Alignment alignment = Alignment::Start;
  Brightness brightness = Brightness::Dark;
  Background background;
  float paddingRight{};
};

// Full override > content override > generated from items > empty
PanelContext resolvePanelContent(std::shared_ptr<const DrawerSlots> slots, const DrawerConfig &config, const Theme &theme);

} // namespace drawer::ui

#endif /* E3A1C0F2_6B4D_4E8A_9C17_5D2F8B0A4E61 */
