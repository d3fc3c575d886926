#include "ferry/filename-decoder.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

#include "ferry/header-block.hpp"
#include "ferry/utf8.hpp"
#include "ferry/vector.hpp"

namespace ferry {

namespace {

std::optional<std::string> DecodeDisposition(const FilenameDecoder& decoder, std::string_view disposition) {
  vector<PartHeaderView> headers;
  headers.push_back(PartHeaderView{"Content-Type", "application/octet-stream"});
  headers.push_back(PartHeaderView{"content-disposition", disposition});
  return decoder.decode(headers);
}

std::string PlainDisposition(std::string_view filename) {
  std::string disposition = "form-data; name=\"file\"; filename=\"";
  disposition.append(filename).append("\"");
  return disposition;
}

}  // namespace

class LenientFilenameDecoderTest : public ::testing::Test {
 protected:
  std::optional<std::string> plain(std::string_view filename) const {
    return DecodeDisposition(decoder, PlainDisposition(filename));
  }

  LenientFilenameDecoder decoder;
};

TEST_F(LenientFilenameDecoderTest, PlainAscii) {
  EXPECT_EQ(plain("report.pdf"), "report.pdf");
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; name=f; filename=unquoted.txt"), "unquoted.txt");
}

TEST_F(LenientFilenameDecoderTest, PercentEncodedUtf8) {
  EXPECT_EQ(plain("%E4%B8%AD%E6%96%87.txt"), "中文.txt");
  EXPECT_EQ(plain("a%20b+c.txt"), "a b+c.txt");
}

TEST_F(LenientFilenameDecoderTest, InvalidPercentSequenceIsKept) {
  EXPECT_EQ(plain("100%.txt"), "100%.txt");
  EXPECT_EQ(plain("%zz.txt"), "%zz.txt");
  // Decodes to bytes that are not UTF-8
  EXPECT_EQ(plain("%FF.txt"), "%FF.txt");
}

TEST_F(LenientFilenameDecoderTest, PlusIsNotASpace) { EXPECT_EQ(plain("a+b.txt"), "a+b.txt"); }

TEST_F(LenientFilenameDecoderTest, ExtendedParameterWins) {
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; name=f; filename=\"fallback.txt\"; "
                                       "filename*=UTF-8''%E4%B8%AD%E6%96%87.txt"),
            "中文.txt");
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; name=f; filename*=utf-8'zh'%E6%96%87%E4%BB%B6"), "文件");
}

TEST_F(LenientFilenameDecoderTest, ExtendedParameterCharsets) {
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename*=ISO-8859-1'en'caf%E9.txt"), "café.txt");
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename*=us-ascii''plain%20name.txt"), "plain name.txt");
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename*=x-unknown''%41.txt"), "A.txt");
  // Without charset'language' prefix
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename*=%E4%B8%AD.txt"), "中.txt");
}

TEST_F(LenientFilenameDecoderTest, UndecodableExtendedParameterFallsBack) {
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename=\"plain.txt\"; filename*=UTF-8''%ZZ"), "plain.txt");
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename=\"plain.txt\"; filename*=UTF-8''%FF"), "plain.txt");
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename=\"plain.txt\"; filename*=us-ascii''%E9"), "plain.txt");
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename=\"plain.txt\"; filename*=UTF-8''"), "plain.txt");
}

TEST_F(LenientFilenameDecoderTest, ExtendedParameterInLegacyCharsets) {
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; name=\"file\"; filename*=GBK''%D6%D0%CE%C4.txt"),
            "\xE4\xB8\xAD\xE6\x96\x87.txt");
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; name=\"file\"; filename=\"x.txt\"; filename*=GBK''%D6%D0%CE%C4.txt"),
            "\xE4\xB8\xAD\xE6\x96\x87.txt");
  // 日本 in Shift_JIS
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename*=Shift_JIS''%93%FA%96%7B.txt"), "日本.txt");
  // 0x80 is the euro sign in windows-1252
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename*=windows-1252''%80.txt"), "€.txt");
}

TEST_F(LenientFilenameDecoderTest, UndecodableExtendedParameterAloneIsStillAFilename) {
  // Truncated GBK sequence, no plain filename: the bytes are kept as Latin-1
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; name=\"file\"; filename*=GBK''a%D6"), "a\xC3\x96");
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; name=\"file\"; filename*=UTF-8''%FF.bin"), "\xC3\xBF.bin");
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; name=\"file\"; filename*=UTF-8''%ZZ"), "%ZZ");
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; name=\"file\"; filename*=UTF-8''"), std::nullopt);
}

TEST_F(LenientFilenameDecoderTest, Latin1MisEncodedCjkIsRecovered) {
  // UTF-8 bytes of the name read as Latin-1 characters then encoded again to UTF-8 by the client
  const std::string misEncoded = utf8::FromLatin1("中文报告.docx");
  ASSERT_NE(misEncoded, "中文报告.docx");
  EXPECT_EQ(plain(misEncoded), "中文报告.docx");
  EXPECT_EQ(plain(utf8::FromLatin1("日本語ファイル.txt")), "日本語ファイル.txt");
  EXPECT_EQ(plain(utf8::FromLatin1("한국어.txt")), "한국어.txt");
}

TEST_F(LenientFilenameDecoderTest, LegitimateNonAsciiNamesAreKept) {
  EXPECT_EQ(plain("中文.txt"), "中文.txt");
  EXPECT_EQ(plain("café.txt"), "café.txt");
  // Reverting would give valid UTF-8 without CJK characters: the original wins
  EXPECT_EQ(plain("Ã©tÃ©.txt"), "Ã©tÃ©.txt");
}

TEST_F(LenientFilenameDecoderTest, RawLatin1BytesAreTranscoded) { EXPECT_EQ(plain("caf\xE9.txt"), "café.txt"); }

TEST_F(LenientFilenameDecoderTest, Deterministic) {
  const std::string misEncoded = utf8::FromLatin1("中文.txt");
  EXPECT_EQ(plain(misEncoded), plain(misEncoded));
  EXPECT_EQ(plain("Ã©tÃ©.txt"), plain("Ã©tÃ©.txt"));
}

TEST_F(LenientFilenameDecoderTest, PartsWithoutFilename) {
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; name=\"comment\""), std::nullopt);
  EXPECT_EQ(plain(""), std::nullopt);
  vector<PartHeaderView> noDisposition;
  noDisposition.push_back(PartHeaderView{"Content-Type", "text/plain"});
  EXPECT_EQ(decoder.decode(noDisposition), std::nullopt);
  EXPECT_EQ(decoder.decode(vector<PartHeaderView>{}), std::nullopt);
}

TEST(StrictFilenameDecoder, Rfc6266) {
  StrictFilenameDecoder decoder;
  EXPECT_EQ(DecodeDisposition(decoder, PlainDisposition("report.pdf")), "report.pdf");
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename=\"x.txt\"; filename*=UTF-8''%E4%B8%AD.txt"), "中.txt");
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename*=iso-8859-1''caf%E9.txt"), "café.txt");
  // Plain filenames are taken literally
  EXPECT_EQ(DecodeDisposition(decoder, PlainDisposition("%E4%B8%AD.txt")), "%E4%B8%AD.txt");
  const std::string misEncoded = utf8::FromLatin1("中文.txt");
  EXPECT_EQ(DecodeDisposition(decoder, PlainDisposition(misEncoded)), misEncoded);
  EXPECT_EQ(DecodeDisposition(decoder, PlainDisposition("caf\xE9.txt")), "café.txt");
}

TEST(StrictFilenameDecoder, RejectsNonStandardExtendedValues) {
  StrictFilenameDecoder decoder;
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename=\"x.txt\"; filename*=x-unknown''%41.txt"), "x.txt");
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename=\"x.txt\"; filename*=%41.txt"), "x.txt");
  // Alone, an undecodable filename* still names a file
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename*=%41.txt"), "A.txt");
}

TEST(StrictFilenameDecoder, ExtendedParameterInLegacyCharset) {
  StrictFilenameDecoder decoder;
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename*=GBK''%D6%D0%CE%C4.txt"), "\xE4\xB8\xAD\xE6\x96\x87.txt");
  EXPECT_EQ(DecodeDisposition(decoder, "form-data; filename=\"x.txt\"; filename*=GBK''%D6%D0%CE%C4.txt"),
            "\xE4\xB8\xAD\xE6\x96\x87.txt");
}

TEST(DecodeExtValue, Forms) {
  EXPECT_EQ(DecodeExtValue("UTF-8''%E2%82%AC%20rates", false), "€ rates");
  EXPECT_EQ(DecodeExtValue("''plain", false), "plain");
  EXPECT_EQ(DecodeExtValue("utf-8'en-US'a%2Fb", false), "a/b");
  EXPECT_EQ(DecodeExtValue("utf-8'only-one-tick", false), std::nullopt);
  EXPECT_EQ(DecodeExtValue("utf-8'only-one-tick", true), "utf-8'only-one-tick");
  EXPECT_EQ(DecodeExtValue("UTF-8''%E2%82", true), std::nullopt);
  EXPECT_EQ(DecodeExtValue("gbk''%D6%D0", false), "中");
  EXPECT_EQ(DecodeExtValue("GBK''%D6", false), std::nullopt);
  EXPECT_EQ(DecodeExtValue("x-unknown''%41", false), std::nullopt);
  EXPECT_EQ(DecodeExtValue("x-unknown''%41", true), "A");
}

TEST(SanitizeLeafName, KeepsLastSegment) {
  EXPECT_EQ(SanitizeLeafName("report.pdf"), "report.pdf");
  EXPECT_EQ(SanitizeLeafName("../../etc/passwd"), "passwd");
  EXPECT_EQ(SanitizeLeafName("/absolute/path/a.txt"), "a.txt");
  EXPECT_EQ(SanitizeLeafName("C:\\Users\\bob\\Desktop\\a.txt"), "a.txt");
  EXPECT_EQ(SanitizeLeafName("..\\..\\windows\\win.ini"), "win.ini");
  EXPECT_EQ(SanitizeLeafName("中文.txt"), "中文.txt");
  EXPECT_EQ(SanitizeLeafName("..hidden"), "..hidden");
}

TEST(SanitizeLeafName, RejectsNamesWithoutLeaf) {
  EXPECT_TRUE(SanitizeLeafName("").empty());
  EXPECT_TRUE(SanitizeLeafName(".").empty());
  EXPECT_TRUE(SanitizeLeafName("..").empty());
  EXPECT_TRUE(SanitizeLeafName("../..").empty());
  EXPECT_TRUE(SanitizeLeafName("dir/").empty());
  EXPECT_TRUE(SanitizeLeafName(std::string_view("a\0b", 3)).empty());
}

}  // namespace ferry
