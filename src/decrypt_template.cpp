#include "decrypt_template.hpp"

// The FORMATS table below must stay identical to format.cpp.
const char kDecryptTemplate[] = R"PAGELOCK(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<meta name="viewport" content="width=device-width, initial-scale=1">
<meta name="robots" content="noindex, nofollow">
<title>{{TITLE}}</title>
<style>
  .pagelock-box { max-width: 24rem; margin: 15vh auto; padding: 1.5rem; font-family: system-ui, sans-serif; border: 1px solid #ccc; border-radius: 8px; }
  .pagelock-box h1 { font-size: 1.25rem; margin: 0 0 1rem 0; }
  .pagelock-box label { display: block; margin-bottom: .25rem; }
  .pagelock-box input { width: 100%; box-sizing: border-box; padding: .5rem; margin-bottom: .75rem; }
  .pagelock-box button { padding: .5rem 1rem; }
  .pagelock-box button[disabled] { opacity: .6; }
  #pagelock-status { min-height: 1.5em; margin: .75rem 0 0 0; }
  #pagelock-status.error { color: #b00020; }
</style>
{{STYLE_BLOCK}}
</head>
<body>
<main class="pagelock-box">
  <h1>{{TITLE}}</h1>
  <form id="pagelock-form" autocomplete="off">
    <label for="pagelock-password">Password</label>
    <input id="pagelock-password" name="password" type="password" autocomplete="off" autofocus required>
    <button id="pagelock-submit" type="submit">Unlock</button>
  </form>
  <p id="pagelock-status" role="status" aria-live="polite"></p>
  <noscript><p>JavaScript is required to open this document.</p></noscript>
</main>
<script id="pagelock-engine">
var PAGELOCK_PAYLOAD = "{{PAYLOAD}}";
var PagelockEngine = (function () {
  "use strict";

  var FORMATS = {
    1: { iterations: 100000, hash: "SHA-256", saltLen: 16, nonceLen: 12, keyBits: 256, tagLen: 16, aad: null },
    2: { iterations: 600000, hash: "SHA-256", saltLen: 16, nonceLen: 12, keyBits: 256, tagLen: 16, aad: [2] }
  };

  function failure(kind) {
    var e = new Error(kind === "auth" ? "authentication failed" : "malformed token");
    e.kind = kind;
    return e;
  }

  function b64decode(s) {
    if (s.length === 0 || s.length % 4 !== 0 || !/^[A-Za-z0-9+\/]*={0,2}$/.test(s)) throw failure("malformed");
    var bin = atob(s);
    var out = new Uint8Array(bin.length);
    for (var i = 0; i < bin.length; i++) out[i] = bin.charCodeAt(i);
    return out;
  }

  function parseToken(token) {
    var t = String(token).replace(/^[ \t\n\r\f\v]+|[ \t\n\r\f\v]+$/g, "");
    var f = t.split(".");
    if (f.length !== 4 || !/^[0-9]{1,3}$/.test(f[0])) throw failure("malformed");
    var version = parseInt(f[0], 10);
    if (!Object.prototype.hasOwnProperty.call(FORMATS, version)) throw failure("malformed");
    var params = FORMATS[version];
    var salt = b64decode(f[1]);
    var nonce = b64decode(f[2]);
    var ciphertext = b64decode(f[3]);
    if (salt.length !== params.saltLen || nonce.length !== params.nonceLen || ciphertext.length < params.tagLen) {
      throw failure("malformed");
    }
    return { version: version, params: params, salt: salt, nonce: nonce, ciphertext: ciphertext };
  }

  function deriveKey(password, salt, params) {
    var subtle = crypto.subtle;
    return subtle.importKey("raw", new TextEncoder().encode(password), "PBKDF2", false, ["deriveKey"])
      .then(function (material) {
        return subtle.deriveKey(
          { name: "PBKDF2", salt: salt, iterations: params.iterations, hash: params.hash },
          material,
          { name: "AES-GCM", length: params.keyBits },
          false,
          ["decrypt"]);
      });
  }

  // onStage("Deriving" | "Decrypting") is optional.
  function decryptToken(token, password, onStage) {
    var stage = onStage || function () {};
    return Promise.resolve().then(function () {
      var p = parseToken(token);
      stage("Deriving");
      return deriveKey(password, p.salt, p.params).then(function (key) {
        stage("Decrypting");
        var alg = { name: "AES-GCM", iv: p.nonce, tagLength: p.params.tagLen * 8 };
        if (p.params.aad) alg.additionalData = new Uint8Array(p.params.aad);
        return crypto.subtle.decrypt(alg, key, p.ciphertext).then(null, function () {
          throw failure("auth");
        });
      });
    }).then(function (plain) {
      return new TextDecoder("utf-8", { ignoreBOM: true }).decode(plain);
    });
  }

  return { FORMATS: FORMATS, parseToken: parseToken, decryptToken: decryptToken };
})();

(function () {
  "use strict";
  if (typeof document === "undefined" || !document.getElementById) return;

  var form = document.getElementById("pagelock-form");
  var input = document.getElementById("pagelock-password");
  var button = document.getElementById("pagelock-submit");
  var status = document.getElementById("pagelock-status");
  var state = "AwaitingPassword";

  function show(text, isError) {
    status.textContent = text;
    status.className = isError ? "error" : "";
  }

  if (typeof crypto === "undefined" || !crypto.subtle) {
    button.disabled = true;
    show("This browser cannot open protected documents (Web Crypto is unavailable).", true);
    return;
  }

  form.addEventListener("submit", function (ev) {
    ev.preventDefault();
    if (state !== "AwaitingPassword") return;
    var password = input.value;
    input.value = "";
    button.disabled = true;
    state = "Deriving";
    show("Unlocking...", false);

    PagelockEngine.decryptToken(PAGELOCK_PAYLOAD, password, function (s) { state = s; })
      .then(function (html) {
        state = "Rendered";
        document.open();
        document.write(html);
        document.close();
      }, function () {
        // Malformed data and a wrong password look the same from here.
        state = "AwaitingPassword";
        button.disabled = false;
        show("Incorrect password or corrupted data.", true);
        input.focus();
      });
    password = null;
  });
})();
</script>
</body>
</html>
)PAGELOCK";
