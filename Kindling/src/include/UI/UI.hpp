#pragma once

// ── Kindling::UI: small retained widget tree ────────────────────────────────
//
// Enough UI for example HUDs: text blocks, buttons and a grid that lays them
// out in rows and equal-width columns. Layout happens while drawing; clicks
// are resolved in Update() against the rectangles of the previous draw.
//
//   auto grid = std::make_shared<UI::Grid>(3, 2);
//   auto save = std::make_shared<UI::Button>("Save Data");
//   save->onClick = [&] { Save(); };
//   grid->Add(save, 1, 1);
//   entity->Add<UI::UIComponent>(std::make_shared<UI::Page>(grid));

#include <Engine/Components.hpp>
#include <Input/InputSource.hpp>
#include <raylib.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Kindling::UI {

struct Thickness {
    float left = 0, top = 0, right = 0, bottom = 0;
};

enum class HorizontalAlignment { Left, Center, Right, Stretch };

// Width of `text` in pixels. Falls back to an estimate without a window.
int MeasureTextWidth(const std::string& text, int fontSize);

class UIElement {
public:
    virtual ~UIElement() = default;

    // Desired size, margin excluded.
    virtual Vector2 Measure() const = 0;

    // Place inside `slot`, honouring margin, width and alignment.
    virtual void Arrange(Rectangle slot);

    virtual void Update(const Input::InputSource&) {}
    virtual void Draw() const = 0;

    Rectangle Bounds() const { return m_bounds; }

    std::string         name;
    Thickness           margin;
    HorizontalAlignment horizontalAlignment = HorizontalAlignment::Stretch;
    float               width   = 0.0f;   // 0 = desired / stretch
    bool                visible = true;

protected:
    Rectangle m_bounds = { 0, 0, 0, 0 };
};

class TextBlock : public UIElement {
public:
    TextBlock() = default;
    explicit TextBlock(std::string t, int size = 20) : text(std::move(t)), fontSize(size) {}

    Vector2 Measure() const override;
    void    Draw() const override;

    std::string         text;
    int                 fontSize      = 20;
    Color               color         = WHITE;
    HorizontalAlignment textAlignment = HorizontalAlignment::Left;
};

class Button : public UIElement {
public:
    Button() = default;
    explicit Button(std::string t) : text(std::move(t)) {}

    Vector2 Measure() const override;
    void    Update(const Input::InputSource& input) override;
    void    Draw() const override;

    // Fire onClick as if the button had been clicked.
    void Click();

    std::string           text;
    int                   fontSize   = 14;
    Color                 background = { 0, 0, 0, 200 };
    Color                 textColor  = WHITE;
    Thickness             padding    = { 5, 5, 5, 5 };
    std::function<void()> onClick;

private:
    bool m_hovered = false;
    bool m_pressed = false;
};

// Rows sized to their tallest child, columns of equal width.
class Grid : public UIElement {
public:
    Grid(int rows, int columns) : m_rows(rows), m_columns(columns) {}

    void Add(std::shared_ptr<UIElement> child, int row, int column, int columnSpan = 1);

    Vector2 Measure() const override;
    void    Arrange(Rectangle slot) override;
    void    Update(const Input::InputSource& input) override;
    void    Draw() const override;

    const std::vector<std::shared_ptr<UIElement>>& Children() const { return m_children; }

    Color background = { 0, 0, 0, 0 };

private:
    struct Cell {
        int row, column, span;
    };

    std::vector<float> RowHeights() const;

    int m_rows, m_columns;
    std::vector<std::shared_ptr<UIElement>> m_children;
    std::vector<Cell>                       m_cells;
};

// Root of a widget tree, laid out across the top of the screen.
class Page {
public:
    Page() = default;
    explicit Page(std::shared_ptr<UIElement> root) : rootElement(std::move(root)) {}

    void Update(const Input::InputSource& input);
    void Draw(int screenWidth, int screenHeight);

    std::shared_ptr<UIElement> rootElement;
};

class UIComponent : public EntityComponent {
public:
    UIComponent() = default;
    explicit UIComponent(std::shared_ptr<Page> p, RenderGroup group = RenderGroup::Group31)
        : page(std::move(p)), renderGroup(group) {}

    std::shared_ptr<Page> page;
    RenderGroup           renderGroup = RenderGroup::Group31;
};

} // namespace Kindling::UI
