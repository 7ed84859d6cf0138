#include <UI/UI.hpp>
#include <algorithm>

namespace Kindling::UI {

// ─── Palette ──────────────────────────────────────────────────────────────────
static constexpr Color BTN_HOVER  = {  60,  60,  60, 220 };
static constexpr Color BTN_PRESS  = {  20,  20,  20, 240 };
static constexpr Color BTN_BORDER = { 120, 120, 120, 255 };
static constexpr Color ACCENT     = { 248, 177, 149, 255 };

int MeasureTextWidth(const std::string& text, int fontSize)
{
    if (IsWindowReady()) return MeasureText(text.c_str(), fontSize);
    return (int)(text.size() * fontSize * 0.55f);
}

// ─── UIElement ────────────────────────────────────────────────────────────────
void UIElement::Arrange(Rectangle slot)
{
    Rectangle inner = { slot.x + margin.left, slot.y + margin.top,
                        slot.width - margin.left - margin.right,
                        slot.height - margin.top - margin.bottom };
    Vector2 desired = Measure();
    float   w       = width > 0.0f ? width : desired.x;

    if (horizontalAlignment == HorizontalAlignment::Stretch && width <= 0.0f) {
        m_bounds = inner;
        return;
    }
    w = std::min(w, inner.width);
    float x = inner.x;
    if (horizontalAlignment == HorizontalAlignment::Center) x += (inner.width - w) * 0.5f;
    if (horizontalAlignment == HorizontalAlignment::Right)  x += inner.width - w;
    m_bounds = { x, inner.y, w, inner.height };
}

// ─── TextBlock ────────────────────────────────────────────────────────────────
Vector2 TextBlock::Measure() const
{
    return { (float)MeasureTextWidth(text, fontSize), (float)fontSize + 4.0f };
}

void TextBlock::Draw() const
{
    if (!visible || text.empty()) return;
    int   tw = MeasureTextWidth(text, fontSize);
    float x  = m_bounds.x;
    if (textAlignment == HorizontalAlignment::Center) x += (m_bounds.width - tw) * 0.5f;
    if (textAlignment == HorizontalAlignment::Right)  x += m_bounds.width - tw;
    float y = m_bounds.y + (m_bounds.height - fontSize) * 0.5f;
    DrawText(text.c_str(), (int)x, (int)y, fontSize, color);
}

// ─── Button ───────────────────────────────────────────────────────────────────
Vector2 Button::Measure() const
{
    return { (float)MeasureTextWidth(text, fontSize) + padding.left + padding.right,
             (float)fontSize + padding.top + padding.bottom };
}

void Button::Update(const Input::InputSource& input)
{
    if (!visible) { m_hovered = m_pressed = false; return; }
    m_hovered = CheckCollisionPointRec(input.MousePosition(), m_bounds);
    m_pressed = m_hovered && input.IsMouseButtonDown(MOUSE_BUTTON_LEFT);
    if (m_hovered && input.IsMouseButtonReleased(MOUSE_BUTTON_LEFT)) Click();
}

void Button::Click()
{
    if (onClick) onClick();
}

void Button::Draw() const
{
    if (!visible) return;
    Color col = m_pressed ? BTN_PRESS : (m_hovered ? BTN_HOVER : background);
    DrawRectangleRec(m_bounds, col);
    DrawRectangleLinesEx(m_bounds, 1.f, m_hovered ? ACCENT : BTN_BORDER);
    int tw = MeasureTextWidth(text, fontSize);
    DrawText(text.c_str(),
             (int)(m_bounds.x + (m_bounds.width  - tw) * 0.5f),
             (int)(m_bounds.y + (m_bounds.height - fontSize) * 0.5f),
             fontSize, textColor);
}

// ─── Grid ─────────────────────────────────────────────────────────────────────
void Grid::Add(std::shared_ptr<UIElement> child, int row, int column, int columnSpan)
{
    if (!child) return;
    row        = std::clamp(row, 0, m_rows - 1);
    column     = std::clamp(column, 0, m_columns - 1);
    columnSpan = std::clamp(columnSpan, 1, m_columns - column);
    m_children.push_back(std::move(child));
    m_cells.push_back({ row, column, columnSpan });
}

std::vector<float> Grid::RowHeights() const
{
    std::vector<float> heights(m_rows, 0.0f);
    for (std::size_t i = 0; i < m_children.size(); ++i) {
        const auto& c = m_children[i];
        if (!c->visible) continue;
        float h = c->Measure().y + c->margin.top + c->margin.bottom;
        heights[m_cells[i].row] = std::max(heights[m_cells[i].row], h);
    }
    return heights;
}

Vector2 Grid::Measure() const
{
    std::vector<float> colWidth(m_columns, 0.0f);
    for (std::size_t i = 0; i < m_children.size(); ++i) {
        const auto& c = m_children[i];
        float w = (c->width > 0.0f ? c->width : c->Measure().x) + c->margin.left + c->margin.right;
        float per = w / m_cells[i].span;
        for (int k = 0; k < m_cells[i].span; ++k)
            colWidth[m_cells[i].column + k] = std::max(colWidth[m_cells[i].column + k], per);
    }
    float widest = 0.0f;
    for (float w : colWidth) widest = std::max(widest, w);

    float height = 0.0f;
    for (float h : RowHeights()) height += h;
    return { widest * m_columns, height };
}

void Grid::Arrange(Rectangle slot)
{
    UIElement::Arrange(slot);

    std::vector<float> heights = RowHeights();
    std::vector<float> top(m_rows, m_bounds.y);
    for (int r = 1; r < m_rows; ++r) top[r] = top[r - 1] + heights[r - 1];

    float cw = m_bounds.width / (float)m_columns;
    for (std::size_t i = 0; i < m_children.size(); ++i) {
        const Cell& cell = m_cells[i];
        m_children[i]->Arrange({ m_bounds.x + cell.column * cw, top[cell.row], cw * cell.span, heights[cell.row] });
    }
}

void Grid::Update(const Input::InputSource& input)
{
    if (!visible) return;
    for (auto& c : m_children) c->Update(input);
}

void Grid::Draw() const
{
    if (!visible) return;
    if (background.a > 0) DrawRectangleRec(m_bounds, background);
    for (const auto& c : m_children) c->Draw();
}

// ─── Page ─────────────────────────────────────────────────────────────────────
void Page::Update(const Input::InputSource& input)
{
    if (rootElement) rootElement->Update(input);
}

void Page::Draw(int screenWidth, int screenHeight)
{
    if (!rootElement || !rootElement->visible) return;
    Vector2 desired = rootElement->Measure();
    float   h       = std::min(desired.y + rootElement->margin.top + rootElement->margin.bottom, (float)screenHeight);
    rootElement->Arrange({ 0, 0, (float)screenWidth, h });
    rootElement->Draw();
}

} // namespace Kindling::UI
