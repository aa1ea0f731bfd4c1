export module Geometry;

export import :GridRect;
export import :VoidRectangleMerger;
