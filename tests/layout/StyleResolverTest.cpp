#include <gtest/gtest.h>
#include <codemap/layout/StyleResolver.h>

using namespace codemap;

TEST(StyleResolverTest, ShapeByKind) {
    EXPECT_EQ(StyleResolver::shapeFor(NodeKind::Class), NodeShape::Rectangle);
    EXPECT_EQ(StyleResolver::shapeFor(NodeKind::Method), NodeShape::RoundedRectangle);
    EXPECT_EQ(StyleResolver::shapeFor(NodeKind::Function), NodeShape::RoundedRectangle);
    EXPECT_EQ(StyleResolver::shapeFor(NodeKind::Property), NodeShape::Circle);
    EXPECT_EQ(StyleResolver::shapeFor(NodeKind::Import), NodeShape::Diamond);
}

TEST(StyleResolverTest, Class_UsesFileColourAndBoldBorder) {
    StyleResolver styles;

    NodeStyle known = styles.nodeStyle(NodeKind::Class, "operations.py");
    EXPECT_EQ(known.background, "#add8e6");
    EXPECT_EQ(known.border, "2px solid #0066cc");
    EXPECT_EQ(known.fontWeight, "bold");

    NodeStyle other = styles.nodeStyle(NodeKind::Class, "other.py");
    EXPECT_EQ(other.background, "#lightcyan");
}

TEST(StyleResolverTest, MethodAndFunction_FallbackColours) {
    StyleResolver styles;

    EXPECT_EQ(styles.nodeStyle(NodeKind::Method, "x.py").background, "#lightsteelblue");
    EXPECT_EQ(styles.nodeStyle(NodeKind::Method, "x.py").border, "1px solid #4682b4");
    EXPECT_EQ(styles.nodeStyle(NodeKind::Function, "x.py").background, "#ffcccb");
    EXPECT_EQ(styles.nodeStyle(NodeKind::Function, "utils.py").background, "#ffffe0");
    EXPECT_FALSE(styles.nodeStyle(NodeKind::Function, "x.py").fontWeight.has_value());
}

TEST(StyleResolverTest, Property_FixedCircle) {
    StyleResolver styles;
    NodeStyle style = styles.nodeStyle(NodeKind::Property, "main.py");

    // File colour does not apply to properties
    EXPECT_EQ(style.background, "#lightpink");
    EXPECT_EQ(style.borderRadius, "50%");
    EXPECT_EQ(style.width, "120px");
    EXPECT_EQ(style.height, "120px");
    EXPECT_EQ(style.display, "flex");
    EXPECT_EQ(style.alignItems, "center");
    EXPECT_EQ(style.justifyContent, "center");
}

TEST(StyleResolverTest, Import_DiamondClipPath) {
    StyleResolver styles;
    NodeStyle style = styles.nodeStyle(NodeKind::Import, "main.py");

    EXPECT_EQ(style.background, "#lightgoldenrodyellow");
    EXPECT_EQ(style.border, "1px solid #daa520");
    EXPECT_EQ(style.borderRadius, "8px");
    EXPECT_EQ(style.width, "100px");
    EXPECT_EQ(style.clipPath, "polygon(50% 0%, 100% 50%, 50% 100%, 0% 50%)");
}

TEST(StyleResolverTest, Unknown_BaseStyle) {
    StyleResolver styles;
    EXPECT_EQ(styles.nodeStyle(NodeKind::Unknown, "main.py"), NodeStyle{});
}

TEST(StyleResolverTest, ContainerStyleAndLabel) {
    StyleResolver styles;

    EXPECT_EQ(styles.containerStyle("main.py").backgroundColor, "#ffeeee");
    EXPECT_EQ(styles.containerStyle("operations.py").backgroundColor, "#eef5ff");
    EXPECT_EQ(styles.containerStyle("utils.py").backgroundColor, "#fffff0");
    EXPECT_EQ(styles.containerStyle("lib/other.py").backgroundColor, "#f9f9f9");
    EXPECT_EQ(styles.containerStyle("main.py").border, "2px solid #999");
    EXPECT_FLOAT_EQ(styles.containerStyle("main.py").opacity, 0.7f);

    EXPECT_EQ(StyleResolver::containerLabel("main.py", 4), "\xF0\x9F\x93\x81 main.py (4 nodes)");
}

TEST(StyleResolverTest, CustomFileColours) {
    StyleResolver styles;
    styles.setNodeFileColor("app.py", "#123456");
    styles.setContainerFileColor("app.py", "#abcdef");

    EXPECT_EQ(styles.nodeStyle(NodeKind::Function, "app.py").background, "#123456");
    EXPECT_EQ(styles.containerStyle("app.py").backgroundColor, "#abcdef");
}

TEST(StyleResolverTest, EdgeStyle) {
    StyleResolver styles;
    EdgeStyle style = styles.edgeStyle();

    EXPECT_EQ(style.type, "smoothstep");
    EXPECT_FLOAT_EQ(style.strokeWidth, 3.0f);
    EXPECT_EQ(style.stroke, "#2563eb");
    EXPECT_EQ(style.zIndex, 10);
    EXPECT_EQ(style.markerEnd.type, "arrowclosed");
    EXPECT_EQ(style.markerEnd.color, style.stroke);
}

TEST(StyleResolverTest, ResolveNode_AddsContainerOffset) {
    StyleResolver styles;
    GraphNode node("a", "run", NodeKind::Function, "x.py", 7);

    Container container;
    container.id = "group-x.py";
    container.position = {1250.0f, 50.0f};

    LocalPlacement placement;
    placement.position = {150.0f, 186.0f};
    placement.rank = 1;

    LayoutNode out = styles.resolveNode(node, container, placement,
                                        {NodeEdge::Left, NodeEdge::Right}, Size{172, 36});

    EXPECT_EQ(out.position, (Point{1400.0f, 236.0f}));
    EXPECT_EQ(out.containerId, "group-x.py");
    EXPECT_EQ(out.rank, 1);
    EXPECT_EQ(out.targetAnchor, NodeEdge::Left);
    EXPECT_EQ(out.sourceAnchor, NodeEdge::Right);
    EXPECT_EQ(out.style.background, "#ffcccb");
    EXPECT_EQ(out.line, 7);
}

TEST(StyleResolverTest, ResolveNode_SizeIsLayoutCellNotDrawnSize) {
    StyleResolver styles;
    GraphNode node("p", "count", NodeKind::Property, "x.py", 3);

    Container container;
    container.id = "group-x.py";

    LocalPlacement placement;
    placement.position = {150.0f, 100.0f};

    LayoutNode out = styles.resolveNode(node, container, placement,
                                        {NodeEdge::Top, NodeEdge::Bottom}, Size{172, 36});

    EXPECT_EQ(out.size, (Size{172.0f, 36.0f}));
    EXPECT_EQ(out.style.width, "120px");
    EXPECT_EQ(out.style.height, "120px");
}
