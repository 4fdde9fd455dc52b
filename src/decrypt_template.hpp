#pragma once

// Page skeleton of a protected document. Placeholders, each replaced once:
//   {{TITLE}}        HTML-escaped page title (appears twice)
//   {{STYLE_BLOCK}}  <style> element with the document's CSS, or nothing
//   {{PAYLOAD}}      the token, escaped for a JS string literal
// The <script id="pagelock-engine"> element is the browser-side decoder.
extern const char kDecryptTemplate[];
