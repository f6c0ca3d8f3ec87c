#include <termspace/layout/LayoutEngine.hpp>

#include "LayoutCache.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cmath>

namespace TS {

namespace {

auto flowChildren(LayoutNode& node) -> std::vector<LayoutNode*> {
    std::vector<LayoutNode*> flow;
    flow.reserve(node.children().size());
    for (auto const& child : node.children()) {
        if (!child->style().isAbsolute())
            flow.push_back(child.get());
    }
    return flow;
}

auto mainOf(Size size, bool row) -> int {
    return row ? size.width : size.height;
}

auto crossOf(Size size, bool row) -> int {
    return row ? size.height : size.width;
}

auto explicitMain(Style const& style, bool row) -> int {
    return row ? style.width : style.height;
}

auto explicitCross(Style const& style, bool row) -> int {
    return row ? style.height : style.width;
}

auto effectiveAlign(LayoutNode const& parent, LayoutNode const& child) -> Align {
    switch (child.style().alignSelf) {
    case AlignSelf::Start:
        return Align::Start;
    case AlignSelf::Center:
        return Align::Center;
    case AlignSelf::End:
        return Align::End;
    case AlignSelf::Stretch:
        return Align::Stretch;
    case AlignSelf::Auto:
        break;
    }
    return parent.style().alignItems;
}

// Width counts code points, not bytes.
auto textSize(std::string const& text) -> Size {
    if (text.empty())
        return Size{};
    int lines = 1;
    int width = 0;
    int line  = 0;
    for (unsigned char c : text) {
        if (c == '\n') {
            width = std::max(width, line);
            line  = 0;
            ++lines;
        } else if ((c & 0xC0) != 0x80) {
            ++line;
        }
    }
    width = std::max(width, line);
    return Size{width, lines};
}

// Spreads `amount` over `weights`, flooring each share and handing the
// remainder out one cell at a time in child order.
auto distribute(int amount, std::vector<double> const& weights) -> std::vector<int> {
    std::vector<int> shares(weights.size(), 0);
    double           total = 0.0;
    for (auto w : weights)
        total += std::max(w, 0.0);
    if (amount <= 0 || total <= 0.0)
        return shares;
    int given = 0;
    for (std::size_t i = 0; i < weights.size(); ++i) {
        shares[i] = static_cast<int>(std::floor(amount * std::max(weights[i], 0.0) / total));
        given += shares[i];
    }
    for (std::size_t i = 0; given < amount && i < weights.size(); ++i) {
        if (weights[i] > 0.0) {
            ++shares[i];
            ++given;
        }
    }
    return shares;
}

auto measureAbsoluteChildren(LayoutNode& node) -> void {
    for (auto const& child : node.children()) {
        if (child->style().isAbsolute())
            LayoutEngine::measure(*child, Constraints::loose(node.measuredWidth, node.measuredHeight));
    }
}

auto collectBoxes(LayoutNode const& root, std::vector<LayoutBox>& boxes) -> void {
    root.visit([&boxes](LayoutNode const& node) {
        boxes.push_back(LayoutBox{node.id(), node.absoluteX, node.absoluteY, node.measuredWidth, node.measuredHeight, node.style().zIndex});
    });
}

// Re-applies cached boxes to the tree; boxes are in the same pre-order.
auto writeBack(std::vector<LayoutNode*> const& roots, LayoutResult const& result) -> bool {
    std::size_t index = 0;
    bool        ok    = true;
    for (auto* root : roots) {
        root->visit([&](LayoutNode& node) {
            if (!ok || index >= result.boxes.size() || result.boxes[index].nodeId != node.id()) {
                ok = false;
                return;
            }
            auto const& box     = result.boxes[index++];
            node.x              = box.x;
            node.y              = box.y;
            node.absoluteX      = box.x;
            node.absoluteY      = box.y;
            node.measuredWidth  = box.width;
            node.measuredHeight = box.height;
        });
    }
    return ok;
}

} // namespace

auto LayoutResult::findBox(std::string_view id) const -> LayoutBox const* {
    auto it = std::find_if(this->boxes.begin(), this->boxes.end(), [id](LayoutBox const& box) { return box.nodeId == id; });
    return it == this->boxes.end() ? nullptr : &*it;
}

LayoutEngine::LayoutEngine(std::size_t cacheCapacity) : cache(std::make_unique<LayoutCache>(cacheCapacity)) {}

LayoutEngine::~LayoutEngine() = default;

auto LayoutEngine::measure(LayoutNode& node, Constraints const& constraints) -> Size {
    auto const& style   = node.style();
    int const   insetH  = style.padding.horizontal() + style.border.horizontal();
    int const   insetV  = style.padding.vertical() + style.border.vertical();
    auto const  inner   = constraints.deflate(insetH, insetV);
    auto const  flow    = flowChildren(node);

    if (flow.empty()) {
        Size result;
        if (style.width >= 0 && style.height >= 0) {
            result = Size{style.width, style.height};
        } else {
            Size content;
            if (auto* measurable = capability<Measurable>(node.component().get()))
                content = measurable->measure(inner);
            else if (node.kind() == NodeKind::Text)
                content = textSize(node.text());
            content.width  = std::max(content.width, 0);
            content.height = std::max(content.height, 0);
            result.width   = style.width >= 0 ? style.width : content.width + insetH;
            result.height  = style.height >= 0 ? style.height : content.height + insetV;
        }
        result              = constraints.constrain(Size{std::max(result.width, 0), std::max(result.height, 0)});
        node.measuredWidth  = result.width;
        node.measuredHeight = result.height;
        measureAbsoluteChildren(node);
        return result;
    }

    bool const row        = node.direction() == Direction::Row;
    int const  insetMain  = row ? insetH : insetV;
    int const  insetCross = row ? insetV : insetH;
    int const  mainMax    = row ? inner.maxWidth : inner.maxHeight;
    int const  crossMax   = row ? inner.maxHeight : inner.maxWidth;
    int const  ownMain    = explicitMain(style, row);
    int const  ownCross   = explicitCross(style, row);

    auto constrainMain  = [&](int v) { return row ? constraints.constrainWidth(v) : constraints.constrainHeight(v); };
    auto constrainCross = [&](int v) { return row ? constraints.constrainHeight(v) : constraints.constrainWidth(v); };

    int const availMain  = ownMain >= 0 ? std::max(constrainMain(ownMain) - insetMain, 0) : mainMax;
    int const availCross = ownCross >= 0 ? std::max(constrainCross(ownCross) - insetCross, 0) : crossMax;
    auto const childLoose = row ? Constraints::loose(availMain, availCross) : Constraints::loose(availCross, availMain);

    std::size_t const   n = flow.size();
    std::vector<int>    basis(n), cross(n);
    std::vector<double> grow(n), shrink(n);
    double              totalGrow = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        auto&       child      = *flow[i];
        auto const& childStyle = child.style();
        auto const  measured   = measure(child, childLoose);
        int const   childMain  = explicitMain(childStyle, row);
        basis[i]  = childStyle.flexBasis >= 0 ? childStyle.flexBasis : (childMain >= 0 ? childMain : mainOf(measured, row));
        cross[i]  = crossOf(measured, row);
        grow[i]   = std::max(childStyle.flexGrow, 0.0);
        shrink[i] = std::max(childStyle.flexShrink, 0.0);
        totalGrow += grow[i];
    }

    int const gaps = style.gap * static_cast<int>(n - 1);
    int       used = gaps;
    for (auto b : basis)
        used += b;

    bool const boundedMain = mainMax < Constraints::kUnbounded;
    int        innerMain   = used;
    if (ownMain >= 0)
        innerMain = availMain;
    else if (boundedMain && (totalGrow > 0.0 || style.justify != Justify::Start))
        innerMain = mainMax;
    int const outerMain = constrainMain(innerMain + insetMain);
    innerMain           = std::max(outerMain - insetMain, 0);

    std::vector<int> finalMain = basis;
    int const        freeSpace = innerMain - used;
    if (freeSpace > 0 && totalGrow > 0.0) {
        auto shares = distribute(freeSpace, grow);
        for (std::size_t i = 0; i < n; ++i)
            finalMain[i] += shares[i];
    } else if (freeSpace < 0) {
        auto shares = distribute(-freeSpace, shrink);
        for (std::size_t i = 0; i < n; ++i)
            finalMain[i] = std::max(finalMain[i] - shares[i], 0);
    }

    int innerCross = 0;
    if (ownCross >= 0) {
        innerCross = availCross;
    } else {
        for (auto c : cross)
            innerCross = std::max(innerCross, c);
    }
    int const outerCross = constrainCross(innerCross + insetCross);
    innerCross           = std::max(outerCross - insetCross, 0);

    for (std::size_t i = 0; i < n; ++i) {
        auto& child      = *flow[i];
        int   childCross = cross[i];
        if (effectiveAlign(node, child) == Align::Stretch && explicitCross(child.style(), row) < 0)
            childCross = innerCross;
        auto const tight = row ? Constraints::tight(finalMain[i], childCross) : Constraints::tight(childCross, finalMain[i]);
        measure(child, tight);
    }

    node.measuredWidth  = row ? outerMain : outerCross;
    node.measuredHeight = row ? outerCross : outerMain;
    measureAbsoluteChildren(node);
    return Size{node.measuredWidth, node.measuredHeight};
}

auto LayoutEngine::arrange(LayoutNode& node, int x, int y) -> void {
    node.x         = x;
    node.y         = y;
    node.absoluteX = x;
    node.absoluteY = y;

    auto const flow = flowChildren(node);
    if (flow.empty())
        return;

    auto const& style      = node.style();
    bool const  row        = node.direction() == Direction::Row;
    int const   innerX     = x + style.padding.left + style.border.left;
    int const   innerY     = y + style.padding.top + style.border.top;
    int const   innerW     = std::max(node.measuredWidth - style.padding.horizontal() - style.border.horizontal(), 0);
    int const   innerH     = std::max(node.measuredHeight - style.padding.vertical() - style.border.vertical(), 0);
    int const   innerMain  = row ? innerW : innerH;
    int const   innerCross = row ? innerH : innerW;
    int const   n          = static_cast<int>(flow.size());

    int used = style.gap * (n - 1);
    for (auto* child : flow)
        used += row ? child->measuredWidth : child->measuredHeight;
    int const freeSpace = std::max(innerMain - used, 0);

    int offset  = 0;
    int spacing = style.gap;
    switch (style.justify) {
    case Justify::Start:
        break;
    case Justify::Center:
        offset = freeSpace / 2;
        break;
    case Justify::End:
        offset = freeSpace;
        break;
    case Justify::SpaceBetween:
        if (n > 1)
            spacing += freeSpace / (n - 1);
        break;
    case Justify::SpaceAround:
        offset = freeSpace / (2 * n);
        spacing += freeSpace / n;
        break;
    case Justify::SpaceEvenly:
        offset = freeSpace / (n + 1);
        spacing += freeSpace / (n + 1);
        break;
    }

    int position = offset;
    for (auto* child : flow) {
        int const childMain  = row ? child->measuredWidth : child->measuredHeight;
        int const childCross = row ? child->measuredHeight : child->measuredWidth;
        int       crossOffset = 0;
        switch (effectiveAlign(node, *child)) {
        case Align::Start:
        case Align::Stretch:
            break;
        case Align::Center:
            crossOffset = std::max((innerCross - childCross) / 2, 0);
            break;
        case Align::End:
            crossOffset = std::max(innerCross - childCross, 0);
            break;
        }
        if (row)
            arrange(*child, innerX + position, innerY + crossOffset);
        else
            arrange(*child, innerX + crossOffset, innerY + position);
        position += childMain + spacing;
    }
}

auto LayoutEngine::applyAbsoluteLayout(LayoutNode& node) -> void {
    for (auto const& child : node.children()) {
        auto const& style = child->style();
        if (!style.isAbsolute()) {
            child->absoluteX = child->x;
            child->absoluteY = child->y;
            applyAbsoluteLayout(*child);
            continue;
        }
        // right/bottom win over left/top when both are given.
        int cx = node.absoluteX + style.left.value_or(0);
        int cy = node.absoluteY + style.top.value_or(0);
        if (style.right)
            cx = node.absoluteX + node.measuredWidth - *style.right - child->measuredWidth;
        if (style.bottom)
            cy = node.absoluteY + node.measuredHeight - *style.bottom - child->measuredHeight;
        arrange(*child, cx, cy);
        applyAbsoluteLayout(*child);
    }
}

auto LayoutEngine::compute(std::vector<LayoutNode*> const& roots, Constraints const& constraints) -> LayoutResult {
    LayoutResult result;
    int          offsetY = 0;
    for (auto* root : roots) {
        auto const size = measure(*root, constraints);
        arrange(*root, 0, offsetY);
        applyAbsoluteLayout(*root);
        offsetY += size.height;
        result.rootWidth = std::max(result.rootWidth, size.width);
        collectBoxes(*root, result.boxes);
    }
    result.rootHeight = offsetY;
    for (auto const& box : result.boxes) {
        result.contentSize.width  = std::max(result.contentSize.width, box.x + box.width);
        result.contentSize.height = std::max(result.contentSize.height, box.y + box.height);
    }
    return result;
}

auto LayoutEngine::layout(LayoutNode& root, Constraints const& constraints) -> LayoutResult {
    return this->layout(std::vector<LayoutNode*>{&root}, constraints);
}

auto LayoutEngine::layout(std::vector<LayoutNode*> const& roots, Constraints const& constraints) -> LayoutResult {
    std::vector<LayoutNode*> live;
    for (auto* root : roots) {
        if (root != nullptr)
            live.push_back(root);
    }
    ++this->cache->totalLayouts;

    bool const dirty = std::any_of(live.begin(), live.end(), [](LayoutNode* root) { return root->subtreeDirty(); });
    auto       key   = LayoutCache::signature(live, constraints);
    if (this->cache->enabled && !dirty) {
        if (auto cached = this->cache->get(key); cached && writeBack(live, *cached)) {
            ++this->cache->hits;
            return *cached;
        }
    }

    ++this->cache->misses;
    ts_log("LayoutEngine::layout computing " + constraints.toString(), "Layout");
    auto result = this->compute(live, constraints);
    for (auto* root : live)
        root->clearDirty();
    if (this->cache->enabled)
        this->cache->put(std::move(key), result);
    return result;
}

auto LayoutEngine::invalidate() -> void {
    this->cache->clear();
}

auto LayoutEngine::invalidateNode(std::string_view id) -> void {
    this->cache->erase(id);
}

auto LayoutEngine::setCacheEnabled(bool enabled) -> void {
    this->cache->enabled = enabled;
    if (!enabled)
        this->cache->clear();
}

auto LayoutEngine::stats() const -> Stats {
    return Stats{this->cache->totalLayouts.load(), this->cache->hits.load(), this->cache->misses.load(), this->cache->size()};
}

} // namespace TS
