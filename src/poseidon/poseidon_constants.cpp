#include <utility>
#include <vector>

#include "poseidon.hpp"

namespace Poseidon {

namespace {

// Round constants, one row per round in consumption order. Entry n is
// SHA-256("invZK_poseidon_inverse_bn254_t3" || be32(n)) mod p.
const char* const ROUND_CONSTANTS_HEX[PoseidonParams::TOTAL_ROUNDS]
                                     [PoseidonParams::STATE_SIZE] = {
    {"0x1b3f51758c09b9e6f7ce10e19350b938de344d87634b3af229405de4cc9be798",
     "0x22c2143485bf4f19cc68e0b3f1156525d6599f38a0240935c384f588f248eabb",
     "0x08e63d5dfbc8715258a5d8fb02c2f59d7e3ba4e5fa0476e408035d451f941986"},
    {"0x1ee945d61f1db15250a67ca206ef2b8fb9e0da1b5d807ca11c570d86b498697e",
     "0x04c0c5b820cc9cc4a3afa76fd212c73aa14b852e343a17cf71ef4372a6beaf75",
     "0x1e58922a86b33f99f76ca7a59d905f6752cfcc5f29e6f4766a671e68d08217c2"},
    {"0x123fff34227af07bff8548333f1f68964a52fa13cbd647f72ad7079c17b9e580",
     "0x1535a564ebaf02727204691b136d5c11a282c8606080a93b17c7cc8c97ceacb9",
     "0x08588793f37e2f34b6f42c763d4f66964c971e7dd6771c9a2e106d82682c8d36"},
    {"0x280e2347abd912c8c58bff0d5cdea496d6c7e9c381d68742587bb1966b6d9ce9",
     "0x00921df8e8990d93fbac428442385e960528cf2763d3fcda71bd3065f55857bd",
     "0x1e5d5f6df980f86d80792926ee243f62d8fb2bc9fcfa3b835ebb183b7f3642fa"},
    {"0x101824c131fc3e39df0bb5db214faa544161e3456c8f609f201501a4b2810f8f",
     "0x1ea1c4a446d15d2d7eb6d8c48f246a106b94682180f75dcb9bc6578f796b5401",
     "0x2525bc05fda6de28fab6dcf4a58a6c19860e935207bd30f90d1d60c91c1d239a"},
    {"0x0a15985106b285909002570ebfbc250acdff7105b444b3c3121ac9f82da40d0f",
     "0x25cfa2f275f9bbff4961925819c2889170032f717298cc3d86ae69e7721f2928",
     "0x03c17ff4718dd75319e2cfbdc53223334fa50ddc33fccbfe9b7e757343240093"},
    {"0x0d0e83f783b231ef8ac3eead96a55b44d4cf5f6e43c2dd6002f78a7e92f1ebd5",
     "0x10c569856f474bc1b366b45f4d23778ffddc22beec0b453d10f7ed52e8c4bd7c",
     "0x2fac6f7fe3556502c74e4643186583f1c4b465ff181da206014c7891ce605f12"},
    {"0x28b9c9486c77036bb7c6e5ccb3d5c5ed6700647febc401dd051d3c3c782743f5",
     "0x0e426c66e4407af7e5ebfdfde835b519c5c6cb42fba28b73de459c0942590283",
     "0x239037b123e6277b5a5add17d28377696d974cea921650b8c46b7d3f4b5a178f"},
    {"0x1643376b78990f4e021ce40d6d7c3c03c446fbc68550666fcb7d67e138ccbb63",
     "0x023ccbdde7641ec3221ebf7c14572969dcec72223dd845543f40ec0f5acbfc1d",
     "0x22722963b969d1d7de1730ba09bcd8abfd68be00041272a7fe18cb213f59cfc4"},
    {"0x1cd183e45cc2f1d46571051cb6bbee9e73103c804bd84188437f7588f1fac05d",
     "0x06d988583978a4cc4194b9653ca5c8443b068670ba2ba3fab3b92b938ee1f6b6",
     "0x0e6c564eca191307853688808e80ae5b0e240accd7ee7776f7f04a16d91a1d15"},
    {"0x1f8d5ab85ca95a62e081ce4779c23b57aa7829fa902ceb92f7b37705e1ca2684",
     "0x10c6a6d790e67788954e591811b9985a4335fabe73e2ee2f39551d9da19a5826",
     "0x20021960a762a71e8332f7b7d1fd7ee5914eb195bbb3ee0342efcbc64b6dd6e2"},
    {"0x29257fd8879324bd3c2bb26d9b75fbc2ae7c536e4b0b107b68034cc08b6c4ba1",
     "0x1919e9e01443b9511f6f8c1b2eabafc52d19cb708671a74e4ea8d06a2b1518ae",
     "0x0149f54e5810a73959b7d72d51f938204667f3c0cda63da6097021703c27336c"},
    {"0x1dd7775cb66ef8aa67c1dd15b5fba79922dab70e509c07a639efecfb69339481",
     "0x0c20fd5273e119beb572d0776ad5c6cad6eea6fdeeb58d37e8c9a471c82cc676",
     "0x079e125da6fc829d551854d954bcfc336c34a3e02472c98b73ee1f75a55f9532"},
    {"0x19ab410e2bac447d5e448aeb40a6b290928aa39b15c566d731727821aaf1d07b",
     "0x03dd7b9043c241400f6f63295b4f8068bf75ad198585c0b9f5f58d0b724775a8",
     "0x08a8199df3cf252846392bb900f5629ca857b3fc9c7d1f14c4379105b242738c"},
    {"0x14207e7a88166de2a61d30c4424224cc47d69e903b29fbfb9165973032f8a422",
     "0x0494fa0d505ef488468ea9022cbfef3cf14102de85a2363684acd65481016cbd",
     "0x0badaafb8d3ed27e7a07b7e62920ac041878ad9f13f1d961b31b7f12fe3d727d"},
    {"0x2573a07307812da1bd155e0c9aa92b1d3f73f6873d6040a25b7ef82a63b1aa6e",
     "0x22e798e5260c9eb4961da61e44adff2f84fb61a60aeba707dd98a3ca926d13df",
     "0x20804e11cc542cd672911f7ad53ab6d064d2e6ee5911656a6c99c0c6c1b6fb08"},
    {"0x0389e2d9bd023536faff39d937c1b1a2346375d494b4cab998c06937546010b4",
     "0x1ac5281f6431d07c186c503e6fbd961dc36d5fedaa98d796958b4469c63b4f37",
     "0x193cd04d43e86d4a8a483cb7e88aac992326d6102ace1e963fb3590dda8225a2"},
    {"0x1a03e8525721a3787a0ee6a9990a4df8c1153919786664fd8cf8c3983f7df994",
     "0x0e4be1cef4b92d0168ab38d5c00c76f0d640c82c475a3f0b04bf18968a19268c",
     "0x11219590e132025bbb75ac6819fd5f438c28b6d603f774f0e1c6f5dba9bde99c"},
    {"0x01909f434480b6570e186a461804c4dd577726832d20af304326971f6217985f",
     "0x1abf03a387f352c5f5af39658270155f6c7b7c4ad3465261874457a105431edb",
     "0x02ded559ee3c446ad8a360d27570f9303228968c09112721d87515113bc15145"},
    {"0x1762b7f4e25033fe20098a330ff065de718cfd1e1078c12de0d5ae150825d986",
     "0x2a1e729d1a0f64a1b5740d704aaba70d177fe59d3d4592f69c2cdb862392c721",
     "0x053a00725a14858b843b8dddd7307cd08e4a1799ddbe128d86c4e092356fa384"},
    {"0x061299c78ec16691dc1587db98fb69ffea0bbaab8f2bbd2313517fc77c87c35c",
     "0x25ece2f1ee1613c0b40ae2e40a3ba903d23b50e2ca81f073095cf661a3ab00c3",
     "0x056967ba37633e8d9b7e9003ebc0e2b20bf09e58a90b55c5b2ad9319aaafdb45"},
    {"0x2f08683c40e43acc25d50307de6c76c993e5e2e70d9150794cdbc519008972ee",
     "0x1700c7199e723267e67912884bf737da4b828e6b41dbeb3db2cb99085bb62620",
     "0x1337aa9cf5a7292fe72a6a0f1699bed06e9f0b4a03e51b2091533e0ac89aceed"},
    {"0x1f6e5d110e6bf48b8b2b74805dc24f5d244bbc3c1aea7dee6fcb12ad5136aa48",
     "0x29db92ab09e8a5c3f8fa9a1ad52b51d5bb4f9beaca7ab609946b96b18cb48973",
     "0x10250263b9c28644880da71fc71cc5500502830210614422cda89970b6392e12"},
    {"0x15d97440625a8cea9363b7ad1bf206d90d63354013c1c51a08211070cc1faaec",
     "0x100fa4cf3c3c8b09c0068840bea343fdfe85a56d15f1d4eaed9dcf81ff119b93",
     "0x13d8692db3b420d0bacd8c252aa3d1e23a41f6299f13ee38ab5540f8209d27a3"},
    {"0x1b130a744c07ae51982629761beb5a8bafa866ffeead1a58c839115d21319f39",
     "0x2deaffde5f9ebd716c4d394fdff3a4ef001bcb26d69d0edbabbc39862e13d718",
     "0x04867fc9513cd79a46bd5d9646eb2c0ddda647c8758ee52a6a0c361cb8125c2d"},
    {"0x13181743ff2e87e72b8e6fb76871df9960dd7f10cf2977f32ada2906a90e15d2",
     "0x165a50a087b507ecd205fc4cad354359bc4509a6e697fd9e7c5d88f75980a1a7",
     "0x02bc34a628aa8dfb27da0a376150c94f18aefb8ef4423e15f36ec0e86adc961e"},
    {"0x185804d2678b5703b786c1af1b61169e746a89bc9fc0c122d4a18e399e35602b",
     "0x0b695c90345902fa29fc00760625e6994e88333f48f54320133d30742a878dd5",
     "0x0cbb1062df9d643b42b6ca4cb0860e239e05ec89af419ffa1730d2a47241635b"},
    {"0x1581b27c1dbae0cae26ca12dcb8973fc04731dc98422f81c556f1371d4fc1206",
     "0x2afe60765464ca92a3a91206e5569fa9e201e715e98746708bf53e8c30b04a34",
     "0x1b4dcbea614169528c5a25edd493fd210df265bc1653764acae8661351f016c1"},
    {"0x0f35b5029ac6f097311713e40921a37ca7378dd79fd8c33e753de21ac734d67d",
     "0x02e1da437036e0ecb20dbef02567b83f6a3858a2c6ca0725cd0577706797f860",
     "0x1f9548b99f786356606e5b8a49379c5aba7bd2f6c944e12274c845787b4cc65d"},
    {"0x1b4bd94dddf6a78a806a0be943b2db6f512e79959cacd4ce9ffe2f54ad92107f",
     "0x15eecf9d362bcb62a363639f3fafa2cd9a8eae291cf79d848bc5f485c0e08e7e",
     "0x0273bf773bc7614e6264d84f28ae1b16c3398e0d8190986f49965efc9641a708"},
    {"0x1a3e4fe0faf8c41880f3708e15c80b956e5517026eaed14160f1dcd708352284",
     "0x115d3c234bba9ba0eb2162258e5b3fb49037841ea0e2418468f7332005ddee72",
     "0x0e41727c6aeb63cb4a742a0aaa59882fa4db572e983b14218e5147cd8f4966ec"},
    {"0x094e2d99c0c5fea09905b9bdadb9e1a045083100cfcaf33bdb1675f15028319e",
     "0x1c5c74243a85f2a25eb07ea621de0467babe7579a9b81d0c2772fe132d457a03",
     "0x059acebff3221ce0adb382a2e6ccde6d2d53375f3a08aad5275bd92dcbcaf382"},
    {"0x17909f7baec664cc0211b9e94a2106f88c273fdbf359f4eb76133b19b84355be",
     "0x02a64aaa00f0764b427c55eb3dab47ef1e1a6e06bd189592b9fa8ad25c7d6601",
     "0x036273b49d92afc80336b12cf1a36f9aea68bff57faed2539cf108198142232a"},
    {"0x0642aa146c133297f0d61658d4ea8f6141520d0ded960ccc5d38e8ab3cf0fde7",
     "0x0239d90b52852a485182cc3dc7a05f7d6b1248572f21b1bf3874adeb07f7c3ee",
     "0x02100557be5d82fd30d2824e8add3620ccf1edd77a625daedf1d912837aaae19"},
    {"0x0ca2baac9de01e53d60242eb538a153c0dad2cb80fe7047a3d55cd68cae9b628",
     "0x226a11d72445110f2df8efaacee801cb6165bee82f4380308e403a83da5f4598",
     "0x0c08b1a07f046ef6a6116cc2b2dae8ac7aa5efe619932979f0a28bd0b0345b0d"},
    {"0x24c3ae5580646cf61590c97c8c70ebb351c8232505dd85741064f5759bfae9bc",
     "0x11fb104af86a183166d5dfd58744f2b2644400217f2aeb08325f25c43c0d622c",
     "0x0630037bf47ac15faddf587183ecbec32a7f24daaaf319831ca1314589b24124"},
    {"0x13b28b2e81ae3a5107f86c90b9fc87525ea0ba77cf51d2292f0f60ed82156dcd",
     "0x1410d9c354acd4d75118198e01985317fd723df6ad5f8b61d01e2fc5f0ca2ca0",
     "0x026a8c8e00e3245386f6076c895f09f9d2f2c3b82b21bc986e571912ee23c5c5"},
    {"0x1ed45cf6dd808e362322a9cc3e32b2a4666510e037e28367c6ee8f9e7fc29ce1",
     "0x2c203417c4cdf09a6bebef80e8d3e6042b05576799aa542c021f723ac848259f",
     "0x0ff2132099562dd7229042e6e036256e1343c7d403a8b707ca50454ffce93068"},
    {"0x1d1cd76a247203e4f96b2213315a0ca91a70021b3e4c275ddfb8d9c688ec161b",
     "0x261f05cce8a713fdb1c29dade93ca73d67e5d99e7d9e5aca1b806db9e52878cb",
     "0x0e697ccf434ec35c0163c33e21f28043ab1ab386bd48babaf25b961ab944ecc3"},
    {"0x24c1f8ec1c93d143d7835e7fa29409d9c8e5e968a9672770302904ea238f96a6",
     "0x10e693d0428c2ca642fe6bb366531b153aa8628de7c1451ecc8bff9e165885d6",
     "0x0d97d8db63cf38d75629596958631693be6ca2de7429019945af5c684c55819e"},
    {"0x0938c0ff740e1cf7db2ecfdf4d1335cb58b4be38a4ad2d069fcfa5be73133e1d",
     "0x071ec59781cbd5256decb3efb6ed98f9a8ed921a99f2c59c07ecfc5ca7be1a04",
     "0x273a61623a3fa521bb28738f9453803bff692771259e5c5550c588c3b30d5e21"},
    {"0x0eb1f18a0489a664bdcec30a5115a4bbc9052226fe9f271883dd2e6de9c40d7c",
     "0x09f390f0b0035492d84e40527eb22004c7a71b6eaa4f634c8a8dd8e87432cbcc",
     "0x28960b12715563b0b59d7deb61d0af97ed9809fa16151c91eab6f74c50c8d874"},
    {"0x0a07336002deb3d0fa43215914df1b957b558619b4f0fa6ab56d0697a30a75c8",
     "0x1c743e3c3920a993a9e8075feb28495f262d795a776ebe1ec1f2a71d4b2ee8bc",
     "0x17bbf55db02fc1c3c90068d6937d9c0213ac95ee50b778feefd221e20ac6c117"},
    {"0x1531dc72700279c17d9af3b26a26ef44b9f73aaf3c08138d63978d208c5948e4",
     "0x0b89c6115617712e07633f6cfd9feed2bcf1eb22bd169c67b6f6d4b0d99289d7",
     "0x28768da7270013e8ff1f83886bb10cfb2c942ace429ba12c0d5172c548de04fd"},
    {"0x2455a8ce0c145e0fd67f589b7ef907fed234bc6e7fe9d8dafd9fee59823a43cd",
     "0x21dd9817728f1b52c0a52993c18406e0e0c9e283b4e934b09212dab2792c818a",
     "0x180731a89c6907c8abaa1ee959dcb86d75840c10b0228b61648f150b3d1eefc3"},
    {"0x2fd6ff992de1f33842c954ef9a0ccefb4fa95f5e38118ee00efc4488f1a8b46a",
     "0x1f100a549b69a42d3282e08251aedc561e1849ad5cc30266c6c1304182acface",
     "0x0db4afebffa6de4494ed0e14f881696063e61cbdcf289eb8b1e9de50cd6d7a4c"},
    {"0x22affa31b60feba75dc79320d0ef55915eaa10aa2047502b32eb84e340b70b48",
     "0x08a4782f88373abee14ac31f711730d9e04d069679274a0e481479e2813635c2",
     "0x1111abce205a4e17ab0fba3e51492be2f9c82c63b362253f145e0f1746153a3d"},
    {"0x232e73da2b6fdae5d8bcc598610cabf877202883159b5b4e852a704eaa0e8c00",
     "0x18e3137ad9a7943812d73a03dd18f613ba2896a20be376dccb46851beb42f97c",
     "0x14068812d81177fb5e5c0bce295f9971b667545a69573a192a84cbe3cf6a42d8"},
    {"0x21f4a06fa74c2b85f85eb8549cfa5a018acc453303433202db183dc4da51f3b7",
     "0x11c096b4e865cb8b23c282f991f69bddeb26d2898f9005decbeea0bc20635b3b",
     "0x1fcc517d81207892e4f42b7869d007ea934491dc255607593995c893ab83a8c2"},
    {"0x00af134fe79f1bc2ad9c652be0d844358a2cc40f377e07be81fde897f13a0e6c",
     "0x1bb0d4f1c9f3c2673efcd8622c86fb60322c3dfe27bdf3d0192ea88d4e5fb81a",
     "0x0fcf7d617e03484a0e3880d7201c340914732ea57f51d506a0cfcb3e84a83e14"},
    {"0x13d47eb7826a6187bca7eb9dc3fc81985c0219e96380f33e4e440cb9b06227be",
     "0x23916c91da538d3b2526fda3cf53ab926796944f11b74e8e5b9c71abab77977e",
     "0x132dbaaaf6420743e276e3854ec02e9008b8427f5b073eee851ce961ceedc1e1"},
    {"0x08d7770f9f6279f832ca94fc2824cf1343cab92e140bf53dcc02aed85efc6248",
     "0x00672e5b6eecdd2f1887cea462fe95a4a35c80c0dafd5b5d1491d24bcca224a3",
     "0x130493b0f04df75dffa6fe6851f2234c01bcc62abef4ec64ba6c0dffdc0f4234"},
    {"0x04095f3375f2a46d3f19f6c7e9e06ad1fac7b46d2aab9b91430934c8c61c7298",
     "0x08614ae2ecce9dc72fd7166024d3ac81126557e96c4d351e8f31bdf8ab5a0bd1",
     "0x0c0a0ec6db0325d3d5b928e242f9b81b12d7b7d9139c402619d3783b07671287"},
    {"0x1b9d08510fbc84e0249c66d923de657ee355d2c033d65ec4722e31cf63149082",
     "0x26a9ba794e67942b8c8c4d16c71c5dcb5eda2342b16d0e310cceab7d5e929e15",
     "0x2cbd1ba1ca8070cf873c5abf98f04aeb11efb5ee0913a290ea40e882ad52a4c2"},
    {"0x1fc1353acee8d2bfd419af1476f95261ad4fe35f77c5fe12d7e500e51bd541ac",
     "0x035629dfb1d4b544df153e1ad97e932b4e2ca9a27c056ef54b074ac38ab782c3",
     "0x1a3f3cdda6177ba35cb38d99723f7aa682ab438e789563f8776ddf14705de899"},
    {"0x29ee9123dde1fa561bc796cbcf77c9540bd33bddf75d4759fd01735b5511b1d5",
     "0x2504c2c518fa65ef407f9c900a87e6be7a007648d8760e0d8863f4aa6764c93b",
     "0x24e28952798a5b11c0769151ca7bcfcc4915ee435bceb6c82512ecf23fd99a3b"},
    {"0x181f0ee15b3328331698d8afb7790de2eb5233ee160a322db59fa3a684b23fa8",
     "0x15911d9c76af6a12f65fc9aa1c968d98c6faa3b890e09fba2280a6098ab8344b",
     "0x022fa0ddd37b0203b355e625d99d1f1cb48930513582a26e8723f2458e1d3f47"},
    {"0x1bfafb26ab93ff2b6147f16c3643a7c2880a208ffbd91ea0aede336c551a9580",
     "0x2e86da1e5d73a92d17b5484c5be907626407a97ac2d56ee0edd0ae9af4918fbc",
     "0x1c5816eb2a7767f04c71473709d7bb5e1acb82df2e065e7b4d9a187884c42a0b"},
    {"0x25847e2fd2740dcf4f510ec57c4554ab6ad11988941edb3442f26af221ad40ad",
     "0x1c60b807c2438e3438c5a5db94def4bc29c7a8520cf88fb95bf56022761e9b0d",
     "0x2c048efd110ce0c5c47f50f1ede5326e88e4463689600d33856b75c4201f9ba7"},
    {"0x14b0d6834d1ac2179e5a827f631eccefe1106b688215af0aa43ec4ed64316be0",
     "0x11b3feb1fdcf2acd19d94c1bbfe94599edc4e74cbc8b0687c6e81a137c03a5ac",
     "0x0024479764100e534a4e2e2eb9fa3b30a2f9a25f9e55d881f37fe4792ac3564c"},
    {"0x1436057dbc02fc415537236ee7a96731a892f6300f6d65ae851a210479cc9f6d",
     "0x0d30017341c40c707bd92a827ff086a2e545d135678e02a722a41c39c76160de",
     "0x033cc8cba3c595839e69f47b1c5a0a56e1e426cd1ebf6b6d789254bafede0f78"},
    {"0x073c4c8bcb8fffab1a4a13efef895b0359e4c8c2da3d3a70c116d8f3ffccbe06",
     "0x0a90edfab6df8f80fb0a8e5a25f5b07ab63a51b08900590de16f736ae2012c5b",
     "0x1d010ef2d044d4ab0e876362a03aa68390b2074a68c2776f8c9b126cdeb25394"},
    {"0x0d58ade2934c7ac10f0ef0b97654395ecbef0e378765fc7b1eef9ecf7a703d87",
     "0x075b92705076658099f4fd85e3fd3c58e77dcfaf50a6b4ef6a3e3489a0511042",
     "0x2bf96e44f654810fbfd77d55a3ff98e2ea6db473c53900f162e0c9073f21475d"},
    {"0x03dda244e61ed1b8001453744b2eadc801983febf708775486e8c20f7ea67e53",
     "0x175024ccc8c21bd1f9c58d2224db929aaab322222070c9f771efa7cfcbcb6176",
     "0x2b7b55f9ec88668832e5bac4ec1f5501a84335387551493524c07f977fcf62b1"},
    {"0x0ba5b29e62b7ab9f09c6e8b4f29bced3daae09040c37511f80884ddeeca38f5d",
     "0x191623af1c1472193af5312a7d2431a5a992e00a0a42413b67289bfa0bd36682",
     "0x1f2e012cbac892b6a9638f3d585dd868ac08b3b3f894f0cb7c3b2335b58860d3"},
};

// Cauchy matrix M[i][j] = 1 / (x_i + y_j), x_i = i, y_j = t + j
const char* const MDS_MATRIX_HEX[PoseidonParams::STATE_SIZE]
                                [PoseidonParams::STATE_SIZE] = {
    {"0x2042def740cbc01bd03583cf0100e59370229adafbd0f5b62d414e62a0000001",
     "0x244b3ad628e5381f4a3c3448e1210245de26ee365b4b146cf2e9782ef4000001",
     "0x135b52945a13d9aa49b9b57c33cd568ba9ae5ce9ca4a2d06e7f3fbd4c6666667"},
    {"0x244b3ad628e5381f4a3c3448e1210245de26ee365b4b146cf2e9782ef4000001",
     "0x135b52945a13d9aa49b9b57c33cd568ba9ae5ce9ca4a2d06e7f3fbd4c6666667",
     "0x285396b510feb022c442e4c2c1411ef84c2b4191bac53323b891a1fb48000001"},
    {"0x135b52945a13d9aa49b9b57c33cd568ba9ae5ce9ca4a2d06e7f3fbd4c6666667",
     "0x285396b510feb022c442e4c2c1411ef84c2b4191bac53323b891a1fb48000001",
     "0x06e9c21069503b73ac9dc0d0edede80d4ee2d80a5a8834a709b290cbfdb6db6e"},
};

}  // namespace

const PoseidonParameters<FieldElement>& PoseidonConstants::parameters() {
  static const PoseidonParameters<FieldElement> params = build();
  return params;
}

PoseidonParameters<FieldElement> PoseidonConstants::build() {
  FieldConstants::init();

  std::vector<std::vector<FieldElement>> round_constants;
  round_constants.reserve(PoseidonParams::TOTAL_ROUNDS);
  for (const auto& row : ROUND_CONSTANTS_HEX) {
    std::vector<FieldElement> tuple;
    for (const char* hex : row) {
      tuple.push_back(FieldElement::from_hex(hex));
    }
    round_constants.push_back(std::move(tuple));
  }

  std::vector<std::vector<FieldElement>> mds_matrix;
  for (const auto& row : MDS_MATRIX_HEX) {
    std::vector<FieldElement> mds_row;
    for (const char* hex : row) {
      mds_row.push_back(FieldElement::from_hex(hex));
    }
    mds_matrix.push_back(std::move(mds_row));
  }

  return PoseidonParameters<FieldElement>(
      PoseidonParams::RATE, PoseidonParams::ROUNDS_FULL,
      PoseidonParams::ROUNDS_PARTIAL, std::move(round_constants),
      std::move(mds_matrix), FieldElement(PoseidonParams::DOMAIN_CONSTANT));
}

}  // namespace Poseidon
