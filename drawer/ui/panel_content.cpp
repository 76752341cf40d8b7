#include "panel_content.hpp"

namespace drawer::ui {

PanelContext resolvePanelContent(std::shared_ptr<const DrawerSlots> slots, const DrawerConfig &config, const Theme &theme) {
  PanelContext context{
      .slots = slots,
      .alignment = config.alignment,
      .brightness = resolveBrightness(config, theme),
      .background = resolveBackground(config, theme),
      .paddingRight = config.offsetFromRight,
  };

  if (!slots)
    return context;

  if (slots->drawer) {
    context.source = PanelContentSource::FullOverride;
    context.renderer = slots->drawer;
    return context;
  }

  context.head = slots->head;
  if (slots->content) {
    context.source = PanelContentSource::ContentOverride;
    context.renderer = slots->content;
  } else if (!slots->items.empty()) {
    context.source = PanelContentSource::GeneratedFromItems;
    context.items = slots->items;
  }
  return context;
}

} // namespace drawer::ui
