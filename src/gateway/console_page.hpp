/**
 * SHOTGATE - Signed Screenshot Gateway
 * Console Page - static HTML served when no url parameter is given
 *
 * The page signs requests in the browser with a secret kept in localStorage,
 * using the same pipe-joined message as the server.
 */

#ifndef SHOTGATE_GATEWAY_CONSOLE_PAGE_HPP
#define SHOTGATE_GATEWAY_CONSOLE_PAGE_HPP

#include <string_view>

namespace shotgate::gateway {

constexpr std::string_view kConsolePageContentType = "text/html; charset=utf-8";

constexpr std::string_view kConsolePage = R"HTML(<!doctype html>
<html lang="en"><meta charset="utf-8">
<title>SHOTGATE console</title>
<style>
  body{font-family:system-ui,sans-serif;max-width:640px;margin:2rem auto;padding:0 1rem;}
  h1{font-size:1.5rem;margin:0 0 1rem;}
  label{display:block;margin-top:1rem;font-weight:600;}
  input,textarea{width:100%;padding:.5rem;border:1px solid #ccc;border-radius:4px;}
  button{margin-top:1rem;padding:.6rem 1.2rem;border:0;border-radius:4px;background:#2d6a4f;color:#fff;font-weight:600;cursor:pointer;}
  img{max-width:100%;display:block;margin-top:1rem;border:1px solid #eee;}
  code{word-break:break-all;display:block;background:#f6f8fa;padding:.5rem;border-radius:4px;}
</style>
<body>
<h1>SHOTGATE console</h1>
<form id="shot">
  <label>Target URL <input name="url" required placeholder="https://example.com"></label>
  <label>Version <input name="version" value="1"></label>
  <label>Width (100-3840) <input name="w" value="1200"></label>
  <label>Height (100-2160 or full) <input name="h" value="800"></label>
  <label>Script to inject <textarea name="js" rows="2"></textarea></label>
  <label>Style to inject <textarea name="css" rows="2"></textarea></label>
  <button type="submit">Sign and render</button>
</form>
<code id="signed"></code>
<img id="preview" alt="">
<script>
const base = location.origin + location.pathname;

document.getElementById('shot').addEventListener('submit', async (ev) => {
  ev.preventDefault();
  let secret = localStorage.getItem('SHOTGATE_SECRET');
  if (!secret) {
    secret = prompt('Signing secret:');
    if (!secret) return;
    localStorage.setItem('SHOTGATE_SECRET', secret);
  }
  const f = new FormData(ev.target);
  const v = (k) => (f.get(k) || '').trim();
  const w = String(parseInt(v('w') || '1200', 10));
  const h = v('h') === 'full' ? 'full' : String(parseInt(v('h') || '800', 10));
  const msg = [v('url'), v('version'), w, h, v('js'), v('css')].join('|');
  const qs = new URLSearchParams({url: v('url'), version: v('version'), w, h, sig: await hmac(secret, msg)});
  if (v('js')) qs.append('js', v('js'));
  if (v('css')) qs.append('css', v('css'));
  const signed = base + '?' + qs.toString();
  document.getElementById('signed').textContent = signed;
  document.getElementById('preview').src = signed;
});

async function hmac(key, msg) {
  const enc = new TextEncoder();
  const k = await crypto.subtle.importKey('raw', enc.encode(key), {name: 'HMAC', hash: 'SHA-256'}, false, ['sign']);
  const sig = await crypto.subtle.sign('HMAC', k, enc.encode(msg));
  return [...new Uint8Array(sig)].map(b => b.toString(16).padStart(2, '0')).join('');
}
</script>
</body></html>
)HTML";

} // namespace shotgate::gateway

#endif // SHOTGATE_GATEWAY_CONSOLE_PAGE_HPP
